#pragma once
#include <cstddef>
#include <string>

namespace ipc
{

// Longest control line accepted; a SCAN line carries one whole code
inline constexpr std::size_t MAX_LINE = 64 * 1024;

using LineHandler = void (*)(const std::string &);

// Serves one line per connection until a "QUIT" line; the socket is removed
// on return.
bool        start_server(const std::string &sock_path, LineHandler on_line);
bool        send_line(const std::string &sock_path, const std::string &line);
std::string expand_user(const std::string &path);

}  // namespace ipc
