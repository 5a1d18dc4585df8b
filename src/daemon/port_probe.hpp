#pragma once

/// True when something accepts TCP connections on 127.0.0.1:<port>
bool tcp_port_open(int port, int timeout_ms = 200);
