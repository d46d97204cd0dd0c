#include "ferry/transfer/types.hpp"

#include <array>
#include <utility>

namespace ferry::transfer {
namespace {

constexpr std::array<std::pair<TransferState, const char*>, 7> kStateNames{{
    {TransferState::Pending, "pending"},
    {TransferState::Negotiating, "negotiating"},
    {TransferState::Transferring, "transferring"},
    {TransferState::Paused, "paused"},
    {TransferState::Completed, "completed"},
    {TransferState::Failed, "failed"},
    {TransferState::Cancelled, "cancelled"},
}};

constexpr std::array<std::pair<Priority, const char*>, 4> kPriorityNames{{
    {Priority::Low, "low"},
    {Priority::Normal, "normal"},
    {Priority::High, "high"},
    {Priority::Urgent, "urgent"},
}};

constexpr std::array<std::pair<QueueState, const char*>, 6> kQueueStateNames{{
    {QueueState::Pending, "pending"},
    {QueueState::Scheduled, "scheduled"},
    {QueueState::Paused, "paused"},
    {QueueState::Cancelled, "cancelled"},
    {QueueState::Completed, "completed"},
    {QueueState::Failed, "failed"},
}};

template<typename Enum, std::size_t N>
const char* name_of(const std::array<std::pair<Enum, const char*>, N>& table, Enum value) noexcept {
    for (const auto& [key, name] : table) {
        if (key == value) {
            return name;
        }
    }
    return "unknown";
}

template<typename Enum, std::size_t N>
std::optional<Enum> value_of(const std::array<std::pair<Enum, const char*>, N>& table,
                             const std::string& name) noexcept {
    for (const auto& [key, text] : table) {
        if (name == text) {
            return key;
        }
    }
    return std::nullopt;
}

} // namespace

const char* to_string(TransferState state) noexcept { return name_of(kStateNames, state); }

std::optional<TransferState> parse_transfer_state(const std::string& name) noexcept {
    return value_of(kStateNames, name);
}

const char* to_string(Priority priority) noexcept { return name_of(kPriorityNames, priority); }

std::optional<Priority> parse_priority(const std::string& name) noexcept {
    return value_of(kPriorityNames, name);
}

const char* to_string(QueueState state) noexcept { return name_of(kQueueStateNames, state); }

std::optional<QueueState> parse_queue_state(const std::string& name) noexcept {
    return value_of(kQueueStateNames, name);
}

ResumePosition position_after(const ResumeToken& token, const TransferManifest& manifest) {
    ResumePosition position;
    if (token.last_completed_file >= 0) {
        position.file_index = static_cast<std::uint32_t>(token.last_completed_file);
        position.chunk = static_cast<std::uint64_t>(token.last_completed_chunk + 1);
    }
    while (position.file_index < manifest.files.size() &&
           position.chunk >= manifest.files[position.file_index].chunk_count) {
        ++position.file_index;
        position.chunk = 0;
    }
    return position;
}

} // namespace ferry::transfer
