#include "floodgate/startup-errors.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace floodgate {

ListenerBindFailure::ListenerBindFailure(std::error_code ec, std::string_view address)
    : std::system_error(ec, "Unable to bind listener " + std::string(address)), _address(address) {}

}  // namespace floodgate
