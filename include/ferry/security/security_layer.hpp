#pragma once

#include "ferry/transport/transport.hpp"

#include <memory>
#include <string>

namespace ferry::security {

/**
 * @brief Wraps raw transport streams, e.g. with encryption
 *
 * The engine wraps every stream it opens or accepts and never looks at the
 * bytes below the wrapper.
 */
class SecurityLayer {
public:
    virtual ~SecurityLayer() = default;

    virtual std::unique_ptr<transport::Stream> wrap(std::unique_ptr<transport::Stream> stream,
                                                    const std::string& peer_id) = 0;
};

/// Leaves streams untouched.
class PassthroughSecurity : public SecurityLayer {
public:
    std::unique_ptr<transport::Stream> wrap(std::unique_ptr<transport::Stream> stream,
                                            const std::string& peer_id) override;
};

/**
 * @brief Base for wrappers that transform frames on their way through
 *
 * Subclasses override seal()/open(); the default implementations forward
 * the frame unchanged.
 */
class FilteredStream : public transport::Stream {
public:
    explicit FilteredStream(std::unique_ptr<transport::Stream> inner);

    ferry::Result<void> send(const std::vector<std::uint8_t>& frame) override;
    ferry::Result<std::vector<std::uint8_t>> recv(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
    void close() override;
    [[nodiscard]] transport::TransportProtocol protocol() const noexcept override;

protected:
    virtual ferry::Result<std::vector<std::uint8_t>> seal(std::vector<std::uint8_t> frame);
    virtual ferry::Result<std::vector<std::uint8_t>> open(std::vector<std::uint8_t> frame);

    transport::Stream& inner() { return *inner_; }

private:
    std::unique_ptr<transport::Stream> inner_;
};

} // namespace ferry::security
