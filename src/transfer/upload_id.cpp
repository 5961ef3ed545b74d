#include "filest/transfer/upload_id.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <stdexcept>

namespace filest::transfer {

std::string generate_upload_id() {
    // random_generator is not thread-safe; one per thread
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

bool is_upload_id(const std::string& text) {
    if (text.size() != 36) {
        return false;
    }
    try {
        const auto parsed = boost::uuids::string_generator()(text);
        return boost::uuids::to_string(parsed) == text;
    } catch (const std::runtime_error&) {
        return false;
    }
}

} // namespace filest::transfer
