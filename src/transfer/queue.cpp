#include "ferry/transfer/queue.hpp"

#include "ferry/core/ids.hpp"
#include "ferry/core/platform.hpp"
#include "ferry/events/events.hpp"
#include "ferry/transfer/records.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace ferry::transfer {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json item_to_json(const QueueItem& item) {
    return {
        {"version", 1},
        {"queue_id", item.queue_id},
        {"request", request_to_json(item.transfer_request)},
        {"priority", to_string(item.priority)},
        {"estimated_start",
         item.estimated_start ? json(core::to_unix_millis(*item.estimated_start)) : json(nullptr)},
        {"state", to_string(item.state)},
        {"created_at", core::to_unix_millis(item.created_at)},
        {"sequence", item.sequence},
        {"session_id", item.session_id},
        {"last_error", item.last_error},
    };
}

QueueItem item_from_json(const json& doc) {
    QueueItem item;
    item.queue_id = doc.at("queue_id").get<std::string>();
    item.transfer_request = request_from_json(doc.at("request"));

    auto priority = parse_priority(doc.at("priority").get<std::string>());
    auto state = parse_queue_state(doc.at("state").get<std::string>());
    if (!priority || !state) {
        throw std::runtime_error("unknown priority or queue state");
    }
    item.priority = *priority;
    item.state = *state;

    if (auto it = doc.find("estimated_start"); it != doc.end() && !it->is_null()) {
        item.estimated_start = core::from_unix_millis(it->get<std::int64_t>());
    }
    item.created_at = core::from_unix_millis(doc.at("created_at").get<std::int64_t>());
    item.sequence = doc.at("sequence").get<std::uint64_t>();
    item.session_id = doc.value("session_id", std::string{});
    item.last_error = doc.value("last_error", std::string{});
    return item;
}

bool admitted_before(const QueueItem& a, const QueueItem& b) {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    return a.sequence < b.sequence;
}

std::optional<std::uint64_t> capped(std::optional<std::uint64_t> requested, std::optional<std::uint64_t> share) {
    if (!share) {
        return requested;
    }
    return requested ? std::min(*requested, *share) : *share;
}

} // namespace

// ════════════════════════════════════════════════════════
// QueueStore
// ════════════════════════════════════════════════════════

QueueStore::QueueStore(fs::path state_dir) : dir_(std::move(state_dir) / "queue") {}

fs::path QueueStore::path_for(const std::string& queue_id) const {
    return dir_ / (queue_id + ".json");
}

ferry::Result<void> QueueStore::save(const QueueItem& item) {
    if (!core::is_valid_id(item.queue_id)) {
        return ferry::Err<void>(ferry::Error::queue("invalid queue id '" + item.queue_id + "'"));
    }
    std::lock_guard lock(mutex_);
    return write_json_atomically(path_for(item.queue_id), item_to_json(item));
}

ferry::Result<void> QueueStore::remove(const std::string& queue_id) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(path_for(queue_id), ec);
    if (ec) {
        return ferry::Err<void>(ferry::Error::storage("cannot remove queue item: " + ec.message(),
                                                      path_for(queue_id).string()));
    }
    return ferry::Ok();
}

ferry::Result<std::vector<QueueItem>> QueueStore::load_all() const {
    std::lock_guard lock(mutex_);
    std::vector<QueueItem> items;

    std::error_code ec;
    if (!fs::exists(dir_, ec)) {
        return ferry::Ok(std::move(items));
    }
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != ".json") {
            continue;
        }
        auto doc = read_json(path);
        if (doc.is_error()) {
            spdlog::warn("Skipping queue item {}: {}", path.string(), doc.error().message);
            continue;
        }
        try {
            items.push_back(item_from_json(doc.value()));
        } catch (const std::exception& e) {
            spdlog::warn("Skipping queue item {}: {}", path.string(), e.what());
        }
    }
    if (ec) {
        return ferry::Err<std::vector<QueueItem>>(
            ferry::Error::storage("cannot list queue directory: " + ec.message(), dir_.string()));
    }
    return ferry::Ok(std::move(items));
}

// ════════════════════════════════════════════════════════
// QueueManager
// ════════════════════════════════════════════════════════

QueueManager::QueueManager(TransferEngine& engine, core::Clock clock)
    : engine_(engine),
      clock_(std::move(clock)),
      store_(engine.config().state_dir),
      max_concurrent_(engine.config().max_concurrent_transfers),
      min_bandwidth_(engine.config().min_bandwidth_per_transfer),
      total_bandwidth_(engine.config().total_bandwidth_limit) {
    subscription_ = engine_.events().subscribe<events::TransferStateChangedEvent>(
        [this](const events::TransferStateChangedEvent& e) { on_session_state(e.session_id, e.to, e.error); });
}

QueueManager::~QueueManager() {
    stop();
    engine_.events().unsubscribe<events::TransferStateChangedEvent>(subscription_);
}

ferry::Result<void> QueueManager::start() {
    auto loaded = store_.load_all();
    if (loaded.is_error()) {
        return ferry::Err<void>(loaded.error());
    }

    {
        std::lock_guard lock(mutex_);
        if (running_) {
            return ferry::Ok();
        }
        for (auto& item : loaded.value()) {
            if (item.state == QueueState::Completed || item.state == QueueState::Cancelled) {
                if (auto removed = store_.remove(item.queue_id); removed.is_error()) {
                    spdlog::warn("{}", removed.error().to_string());
                }
                continue;
            }
            if (item.state == QueueState::Scheduled) {
                item.state = QueueState::Pending;
            }
            item.session_id.clear();
            next_sequence_ = std::max(next_sequence_, item.sequence + 1);
            const auto id = item.queue_id;
            items_[id] = std::move(item);
            persist_locked(items_[id]);
        }
        refresh_estimates_locked();
        running_ = true;
        stopping_ = false;
        spdlog::info("Queue started with {} persisted items", items_.size());
    }

    scheduler_ = std::thread([this] { scheduler_loop(); });
    wake();
    return ferry::Ok();
}

void QueueManager::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        stopping_ = true;
    }
    wake_cv_.notify_all();
    if (scheduler_.joinable()) {
        scheduler_.join();
    }
    std::lock_guard lock(mutex_);
    running_ = false;
}

void QueueManager::wake() {
    {
        std::lock_guard lock(mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_all();
}

void QueueManager::scheduler_loop() {
    while (true) {
        {
            std::unique_lock lock(mutex_);
            wake_cv_.wait_for(lock, std::chrono::seconds{1}, [this] { return stopping_ || wake_pending_; });
            if (stopping_) {
                return;
            }
            wake_pending_ = false;
        }
        schedule_once();
    }
}

ferry::Result<std::string> QueueManager::enqueue(TransferRequest request, Priority priority) {
    if (request.paths.empty()) {
        return ferry::Err<std::string>(ferry::Error::queue("transfer request has no paths"));
    }
    if (request.peer_id.empty()) {
        return ferry::Err<std::string>(ferry::Error::queue("transfer request has no peer"));
    }

    QueueItem item;
    item.queue_id = core::generate_id();
    item.transfer_request = std::move(request);
    item.priority = priority;
    item.created_at = clock_();
    {
        std::lock_guard lock(mutex_);
        item.sequence = next_sequence_++;
        items_[item.queue_id] = item;
        persist_locked(item);
        refresh_estimates_locked();
    }
    spdlog::info("Queued {} ({} priority) for {}", item.queue_id, to_string(priority), item.transfer_request.peer_id);
    announce(item);
    wake();
    return ferry::Ok(item.queue_id);
}

ferry::Result<void> QueueManager::reorder(const std::string& queue_id, std::size_t new_position) {
    QueueItem changed;
    {
        std::lock_guard lock(mutex_);
        auto found = find_locked(queue_id);
        if (found.is_error()) {
            return ferry::Err<void>(found.error());
        }
        auto* item = found.value();
        if (item->state != QueueState::Pending) {
            return ferry::Err<void>(
                ferry::Error::state(std::string("cannot reorder an item that is ") + to_string(item->state)));
        }

        auto order = pending_locked();
        if (new_position >= order.size()) {
            return ferry::Err<void>(ferry::Error::queue("position " + std::to_string(new_position) +
                                                        " outside the pending queue"));
        }
        order.erase(std::find(order.begin(), order.end(), item));
        order.insert(order.begin() + static_cast<std::ptrdiff_t>(new_position), item);

        if (new_position + 1 < order.size()) {
            item->priority = order[new_position + 1]->priority;
        } else if (new_position > 0) {
            item->priority = order[new_position - 1]->priority;
        }

        std::uint64_t sequence = 0;
        for (auto* entry : order) {
            entry->sequence = sequence++;
        }
        next_sequence_ = std::max(next_sequence_, sequence);
        for (auto* entry : order) {
            persist_locked(*entry);
        }
        refresh_estimates_locked();
        changed = *item;
    }
    announce(changed);
    return ferry::Ok();
}

ferry::Result<void> QueueManager::change_priority(const std::string& queue_id, Priority priority) {
    QueueItem changed;
    {
        std::lock_guard lock(mutex_);
        auto found = find_locked(queue_id);
        if (found.is_error()) {
            return ferry::Err<void>(found.error());
        }
        auto* item = found.value();
        if (item->state != QueueState::Pending && item->state != QueueState::Paused) {
            return ferry::Err<void>(
                ferry::Error::state(std::string("cannot change priority of an item that is ") + to_string(item->state)));
        }
        item->priority = priority;
        persist_locked(*item);
        refresh_estimates_locked();
        changed = *item;
    }
    announce(changed);
    return ferry::Ok();
}

ferry::Result<void> QueueManager::pause(const std::string& queue_id) {
    std::string session_id;
    {
        std::lock_guard lock(mutex_);
        auto found = find_locked(queue_id);
        if (found.is_error()) {
            return ferry::Err<void>(found.error());
        }
        auto* item = found.value();
        if (item->state != QueueState::Pending && item->state != QueueState::Scheduled) {
            return ferry::Err<void>(
                ferry::Error::state(std::string("cannot pause an item that is ") + to_string(item->state)));
        }
        session_id = item->state == QueueState::Scheduled ? item->session_id : std::string{};
    }

    if (!session_id.empty()) {
        if (auto paused = engine_.pause_transfer(session_id); paused.is_error()) {
            return paused;
        }
    }

    QueueItem changed;
    {
        std::lock_guard lock(mutex_);
        auto found = find_locked(queue_id);
        if (found.is_error()) {
            return ferry::Err<void>(found.error());
        }
        found.value()->state = QueueState::Paused;
        persist_locked(*found.value());
        refresh_estimates_locked();
        changed = *found.value();
    }
    announce(changed);
    return ferry::Ok();
}

ferry::Result<void> QueueManager::resume(const std::string& queue_id) {
    std::string session_id;
    {
        std::lock_guard lock(mutex_);
        auto found = find_locked(queue_id);
        if (found.is_error()) {
            return ferry::Err<void>(found.error());
        }
        auto* item = found.value();
        if (item->state != QueueState::Paused) {
            return ferry::Err<void>(
                ferry::Error::state(std::string("cannot resume an item that is ") + to_string(item->state)));
        }
        session_id = item->session_id;
    }

    bool live = false;
    if (!session_id.empty()) {
        auto session = engine_.session(session_id);
        if (session && session->state() == TransferState::Paused) {
            if (auto resumed = engine_.resume_paused_transfer(session_id); resumed.is_error()) {
                return resumed;
            }
            live = true;
        }
    }

    QueueItem changed;
    {
        std::lock_guard lock(mutex_);
        auto found = find_locked(queue_id);
        if (found.is_error()) {
            return ferry::Err<void>(found.error());
        }
        auto* item = found.value();
        item->state = live ? QueueState::Scheduled : QueueState::Pending;
        if (!live) {
            item->session_id.clear();
        }
        persist_locked(*item);
        refresh_estimates_locked();
        changed = *item;
    }
    announce(changed);
    wake();
    return ferry::Ok();
}

ferry::Result<void> QueueManager::cancel(const std::string& queue_id) {
    std::string session_id;
    QueueItem changed;
    {
        std::lock_guard lock(mutex_);
        auto found = find_locked(queue_id);
        if (found.is_error()) {
            return ferry::Err<void>(found.error());
        }
        auto* item = found.value();
        if (item->state == QueueState::Cancelled) {
            return ferry::Ok();
        }
        if (item->state == QueueState::Completed || item->state == QueueState::Failed) {
            return ferry::Err<void>(
                ferry::Error::state(std::string("cannot cancel an item that is ") + to_string(item->state)));
        }
        session_id = item->session_id;
        if (session_id.empty()) {
            item->state = QueueState::Cancelled;
            changed = *item;
            items_.erase(queue_id);
            if (auto removed = store_.remove(queue_id); removed.is_error()) {
                spdlog::warn("{}", removed.error().to_string());
            }
            refresh_estimates_locked();
        }
    }

    if (!session_id.empty()) {
        // The session's terminal event moves the item to Cancelled.
        return engine_.cancel_transfer(session_id);
    }
    announce(changed);
    return ferry::Ok();
}

ferry::Result<QueueItem> QueueManager::status(const std::string& queue_id) const {
    std::lock_guard lock(mutex_);
    auto it = items_.find(queue_id);
    if (it == items_.end()) {
        return ferry::Err<QueueItem>(ferry::Error::queue("unknown queue item " + queue_id));
    }
    return ferry::Ok(it->second);
}

std::vector<QueueItem> QueueManager::items() const {
    std::lock_guard lock(mutex_);
    std::vector<QueueItem> all;
    for (const auto& [id, item] : items_) {
        all.push_back(item);
    }
    std::sort(all.begin(), all.end(), admitted_before);
    return all;
}

std::vector<QueueItem> QueueManager::pending() const {
    std::vector<QueueItem> result;
    for (auto& item : items()) {
        if (item.state == QueueState::Pending) {
            result.push_back(std::move(item));
        }
    }
    return result;
}

std::optional<QueueItem> QueueManager::next() const {
    auto queue = pending();
    if (queue.empty()) {
        return std::nullopt;
    }
    return queue.front();
}

std::size_t QueueManager::active_count() const {
    std::lock_guard lock(mutex_);
    return active_locked();
}

std::size_t QueueManager::clear_finished() {
    std::lock_guard lock(mutex_);
    std::size_t removed = 0;
    for (auto it = items_.begin(); it != items_.end();) {
        if (it->second.state == QueueState::Failed || it->second.state == QueueState::Completed) {
            if (auto dropped = store_.remove(it->first); dropped.is_error()) {
                spdlog::warn("{}", dropped.error().to_string());
            }
            it = items_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void QueueManager::set_total_bandwidth(std::optional<std::uint64_t> bytes_per_second) {
    {
        std::lock_guard lock(mutex_);
        total_bandwidth_ = bytes_per_second;
    }
    rebalance_bandwidth();
    wake();
}

std::optional<std::uint64_t> QueueManager::bandwidth_share() const {
    std::lock_guard lock(mutex_);
    if (!total_bandwidth_) {
        return std::nullopt;
    }
    return *total_bandwidth_ / std::max<std::size_t>(1, active_locked());
}

// ════════════════════════════════════════════════════════
// Scheduling
// ════════════════════════════════════════════════════════

std::size_t QueueManager::schedule_once() {
    std::size_t started = 0;
    while (auto admission = admit_next()) {
        announce(admission->item);

        auto request = admission->item.transfer_request;
        request.options.bandwidth_limit = capped(request.options.bandwidth_limit, admission->share);
        attach_session(admission->item.queue_id, engine_.start_transfer(request));
        ++started;
    }
    if (started > 0) {
        rebalance_bandwidth();
    }
    return started;
}

std::optional<QueueManager::Admission> QueueManager::admit_next() {
    std::lock_guard lock(mutex_);
    if (stopping_) {
        return std::nullopt;
    }
    const auto active = active_locked();
    if (active >= max_concurrent_) {
        return std::nullopt;
    }
    auto order = pending_locked();
    if (order.empty()) {
        return std::nullopt;
    }

    Admission admission;
    if (total_bandwidth_) {
        const auto share = *total_bandwidth_ / (active + 1);
        if (share < min_bandwidth_) {
            spdlog::debug("Bandwidth budget exhausted: {} B/s per transfer is below {}", share, min_bandwidth_);
            return std::nullopt;
        }
        admission.share = share;
    }

    auto* item = order.front();
    item->state = QueueState::Scheduled;
    item->estimated_start = clock_();
    admitted_at_[item->queue_id] = clock_();
    persist_locked(*item);
    refresh_estimates_locked();
    admission.item = *item;
    return admission;
}

void QueueManager::attach_session(const std::string& queue_id,
                                  ferry::Result<std::shared_ptr<TransferSession>> session) {
    std::optional<TransferState> already;
    std::optional<Error> already_error;
    QueueItem changed;
    {
        std::lock_guard lock(mutex_);
        auto it = items_.find(queue_id);
        if (it == items_.end()) {
            return;
        }
        auto& item = it->second;
        if (session.is_error()) {
            spdlog::error("Queue item {} could not start: {}", queue_id, session.error().to_string());
            finish_item(item, TransferState::Failed, session.error());
            changed = item;
        } else {
            item.session_id = session.value()->id();
            persist_locked(item);
            const auto state = session.value()->state();
            if (is_terminal(state)) {
                already = state;
                already_error = session.value()->error();
            }
            changed = item;
        }
    }
    if (already) {
        // Finished before the mapping existed, so its terminal event was missed.
        on_session_state(changed.session_id, *already, already_error);
        return;
    }
    announce(changed);
}

void QueueManager::on_session_state(const std::string& session_id, TransferState state,
                                    const std::optional<Error>& error) {
    if (!is_terminal(state)) {
        return;
    }
    QueueItem changed;
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(items_.begin(), items_.end(),
                               [&session_id](const auto& entry) { return entry.second.session_id == session_id; });
        if (it == items_.end()) {
            return;
        }
        auto& item = it->second;
        if (item.state != QueueState::Scheduled && item.state != QueueState::Paused) {
            return;
        }
        if (state == TransferState::Failed && error && error->kind == ErrorKind::Cancelled) {
            // Suspended by engine shutdown; the stored item is queued again on the next start().
            spdlog::info("Queue item {} suspended with its session {}", item.queue_id, session_id);
            return;
        }
        finish_item(item, state, error);
        changed = item;
        if (changed.state == QueueState::Completed || changed.state == QueueState::Cancelled) {
            items_.erase(it);
        }
        refresh_estimates_locked();
    }
    announce(changed);
    rebalance_bandwidth();
    wake();
}

void QueueManager::finish_item(QueueItem& item, TransferState state, const std::optional<Error>& error) {
    const auto now = clock_();
    if (auto admitted = admitted_at_.find(item.queue_id); admitted != admitted_at_.end()) {
        if (state == TransferState::Completed) {
            const auto took = std::chrono::duration_cast<std::chrono::seconds>(now - admitted->second);
            average_duration_ = (average_duration_ * finished_count_ + took) / (finished_count_ + 1);
            ++finished_count_;
        }
        admitted_at_.erase(admitted);
    }

    if (state == TransferState::Completed || state == TransferState::Cancelled) {
        item.state = state == TransferState::Completed ? QueueState::Completed : QueueState::Cancelled;
        if (auto removed = store_.remove(item.queue_id); removed.is_error()) {
            spdlog::warn("{}", removed.error().to_string());
        }
        return;
    }
    item.state = QueueState::Failed;
    item.last_error = error ? error->to_string() : "transfer failed";
    persist_locked(item);
}

void QueueManager::rebalance_bandwidth() {
    std::vector<std::pair<std::string, std::optional<std::uint64_t>>> limits;
    {
        std::lock_guard lock(mutex_);
        std::optional<std::uint64_t> share;
        if (total_bandwidth_) {
            share = *total_bandwidth_ / std::max<std::size_t>(1, active_locked());
        }
        for (const auto& [id, item] : items_) {
            if (item.state == QueueState::Scheduled && !item.session_id.empty()) {
                limits.emplace_back(item.session_id, capped(item.transfer_request.options.bandwidth_limit, share));
            }
        }
    }
    for (const auto& [session_id, limit] : limits) {
        if (auto applied = engine_.set_bandwidth_limit(session_id, limit); applied.is_error()) {
            spdlog::debug("Bandwidth share not applied to {}: {}", session_id, applied.error().message);
        }
    }
}

// ════════════════════════════════════════════════════════
// Helpers (mutex_ held)
// ════════════════════════════════════════════════════════

std::vector<QueueItem*> QueueManager::pending_locked() {
    std::vector<QueueItem*> order;
    for (auto& [id, item] : items_) {
        if (item.state == QueueState::Pending) {
            order.push_back(&item);
        }
    }
    std::sort(order.begin(), order.end(), [](const QueueItem* a, const QueueItem* b) { return admitted_before(*a, *b); });
    return order;
}

std::size_t QueueManager::active_locked() const {
    return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(), [](const auto& entry) {
        const auto& item = entry.second;
        return item.state == QueueState::Scheduled || (item.state == QueueState::Paused && !item.session_id.empty());
    }));
}

void QueueManager::refresh_estimates_locked() {
    const auto now = clock_();
    const auto active = active_locked();
    const std::size_t free_slots = active >= max_concurrent_ ? 0 : max_concurrent_ - active;

    std::size_t position = 0;
    for (auto* item : pending_locked()) {
        if (position < free_slots) {
            item->estimated_start = now;
        } else {
            const auto rounds = (position - free_slots) / max_concurrent_ + 1;
            item->estimated_start = now + average_duration_ * static_cast<std::int64_t>(rounds);
        }
        ++position;
    }
}

void QueueManager::persist_locked(const QueueItem& item) {
    if (auto saved = store_.save(item); saved.is_error()) {
        spdlog::error("Queue item {} not persisted: {}", item.queue_id, saved.error().to_string());
    }
}

void QueueManager::announce(const QueueItem& item) {
    engine_.events().emit(events::QueueChangedEvent{item.queue_id, item.state, item.priority, item.session_id});
}

ferry::Result<QueueItem*> QueueManager::find_locked(const std::string& queue_id) {
    auto it = items_.find(queue_id);
    if (it == items_.end()) {
        return ferry::Err<QueueItem*>(ferry::Error::queue("unknown queue item " + queue_id));
    }
    return ferry::Ok(&it->second);
}

} // namespace ferry::transfer
