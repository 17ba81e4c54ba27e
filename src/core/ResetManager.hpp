/**************************************************************
 *  Central reset coordinator: route all restart requests through
 *  Panel so the workers are stopped before the chip restarts.
 **************************************************************/
#pragma once

class Panel;

namespace ResetManager {

// Register the panel that executes resets (from its loop()).
void Init(Panel* panel);

// Queue an orderly restart. Safe from any task.
void RequestReset(const char* reason = nullptr);

// Boot cannot continue: journal it, count down, restart. Never returns.
void Fatal(const char* where, const char* reason);

}  // namespace ResetManager
