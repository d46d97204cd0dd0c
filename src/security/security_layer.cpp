#include "ferry/security/security_layer.hpp"

namespace ferry::security {

std::unique_ptr<transport::Stream> PassthroughSecurity::wrap(std::unique_ptr<transport::Stream> stream,
                                                             const std::string&) {
    return stream;
}

FilteredStream::FilteredStream(std::unique_ptr<transport::Stream> inner) : inner_(std::move(inner)) {}

ferry::Result<void> FilteredStream::send(const std::vector<std::uint8_t>& frame) {
    auto sealed = seal(frame);
    if (sealed.is_error()) {
        return ferry::Err<void>(sealed.error());
    }
    return inner_->send(sealed.value());
}

ferry::Result<std::vector<std::uint8_t>> FilteredStream::recv(std::optional<std::chrono::milliseconds> timeout) {
    auto frame = inner_->recv(timeout);
    if (frame.is_error()) {
        return frame;
    }
    return open(std::move(frame.value()));
}

void FilteredStream::close() {
    inner_->close();
}

transport::TransportProtocol FilteredStream::protocol() const noexcept {
    return inner_->protocol();
}

ferry::Result<std::vector<std::uint8_t>> FilteredStream::seal(std::vector<std::uint8_t> frame) {
    return ferry::Ok(std::move(frame));
}

ferry::Result<std::vector<std::uint8_t>> FilteredStream::open(std::vector<std::uint8_t> frame) {
    return ferry::Ok(std::move(frame));
}

} // namespace ferry::security
