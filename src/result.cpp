#include "libsvcloc/result.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace libsvcloc {

error::error(std::string message, std::exception_ptr exception, std::any payload)
    : message_(std::move(message))
    , exception_(std::move(exception))
    , payload_(std::move(payload))
{}

error error::from_exception(std::exception_ptr exception, std::any payload) {
    std::string message = "Unknown exception";
    if (exception) {
        try {
            std::rethrow_exception(exception);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            // non-std exception: keep the generic message, the pointer is retained
        }
    }
    return error(std::move(message), std::move(exception), std::move(payload));
}

error error::aggregate(std::vector<error> errors) {
    error agg("Multiple errors occurred, see errors() for details.");
    agg.errors_ = std::move(errors);
    agg.aggregate_ = true;
    return agg;
}

bool error::is_similar_to(const error& other) const {
    return std::equal(message_.begin(), message_.end(),
                      other.message_.begin(), other.message_.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a))
                              == std::tolower(static_cast<unsigned char>(b));
                      });
}

void error::raise() const {
    if (exception_) {
        std::rethrow_exception(exception_);
    }
    throw std::runtime_error(message_);
}

} // namespace libsvcloc
