#pragma once

#include <string>

namespace platform {

// Per-user directories. Empty when neither the XDG variable nor HOME is set.
std::string config_dir();
std::string data_dir();

// $LIVECAP_SOCKET, else $XDG_RUNTIME_DIR/livecap.sock, else a per-uid
// path under /tmp.
std::string control_socket_path();

} // namespace platform
