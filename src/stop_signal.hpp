#pragma once

// SIGINT/SIGTERM set a flag; the run loop polls it between ticks.
void install_stop_handlers();
bool stop_requested();
void request_stop();
void reset_stop();
