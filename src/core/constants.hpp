#pragma once

#include <cstddef>

// ── Remote defaults ─────────────────────────────────────────
constexpr const char* DEFAULT_REMOTE_USER     = "ubuntu";
constexpr const char* DEFAULT_VENV_ROOT       = "~/";
constexpr const char* DEFAULT_PYTHON_CMD      = "python";
constexpr int DEFAULT_SSH_PORT                = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS        = 30;    // TCP connect + handshake + auth
constexpr int SSH_CMD_TIMEOUT_SECS            = 1800;  // pip installs can be slow
constexpr int SSH_CHANNEL_OPEN_TIMEOUT_SECS   = 30;
constexpr int REGISTRAR_TIMEOUT_MS            = 120000;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE               = 4096;

// ── Kernel / manifest ───────────────────────────────────────
constexpr const char* DEFAULT_KERNEL_PACKAGE  = "jupyter";
constexpr const char* DEFAULT_KERNEL_LANGUAGE = "python";
constexpr const char* DEFAULT_REGISTRAR       = "rk";
constexpr const char* REQUIREMENTS_FILENAME   = "requirements.txt";

// Interpreters resolved under this prefix are system installs → sudo
constexpr const char* SYSTEM_PREFIX           = "/usr";

// Longest stdout/stderr excerpt carried into log lines and error messages
constexpr size_t LOG_EXCERPT_CHARS            = 500;
