#include "stop_signal.hpp"
#include <csignal>

namespace
{
    volatile std::sig_atomic_t g_stop = 0;

    void on_stop_signal(int)
    {
        g_stop = 1;
    }
}

void install_stop_handlers()
{
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);
}

bool stop_requested() { return g_stop != 0; }
void request_stop() { g_stop = 1; }
void reset_stop() { g_stop = 0; }
