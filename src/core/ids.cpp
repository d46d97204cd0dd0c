#include "ferry/core/ids.hpp"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>
#include <stdexcept>

namespace ferry::core {

std::string generate_id() {
    static std::mutex mutex;
    static boost::uuids::random_generator generator;
    std::lock_guard lock(mutex);
    return boost::uuids::to_string(generator());
}

bool is_valid_id(const std::string& text) {
    if (text.size() != 36) {
        return false;
    }
    try {
        boost::uuids::string_generator parse;
        parse(text);
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

} // namespace ferry::core
