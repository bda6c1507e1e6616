#ifndef CHUNKVAULT_BACKEND_BACKEND_ERROR_HPP
#define CHUNKVAULT_BACKEND_BACKEND_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkvault {
namespace backend {

class BackendError : public std::runtime_error {
public:
  explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace backend
} // namespace chunkvault

#endif // CHUNKVAULT_BACKEND_BACKEND_ERROR_HPP
