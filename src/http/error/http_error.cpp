#include "http_error.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "../../utils/string_utils.hpp"

namespace http::http_error {
    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg),
          status_(s),
          url_(std::move(u)),
          body_preview_(string_utils::truncate(string_utils::sanitize_utf8(preview), ERROR_MESSAGE_LENGTH)) {}
}  // namespace http::http_error
