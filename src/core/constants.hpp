#pragma once

#include <cstddef>

// ── Connection defaults ─────────────────────────────────────
constexpr const char* DEFAULT_HOST       = "localhost";
constexpr int DEFAULT_PORT               = 22;
constexpr const char* DEFAULT_WORKDIR    = ".";
constexpr const char* DEFAULT_OPERATION  = "list";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 30;    // TCP connect + SSH handshake
constexpr int SSH_KEEPALIVE_SECS         = 30;    // libssh2 keepalive interval

// ── Transfer ────────────────────────────────────────────────
constexpr std::size_t SFTP_CHUNK_SIZE    = 32 * 1024;
constexpr int PUT_DEFAULT_CONCURRENCY    = 64;
constexpr unsigned DIR_CREATE_MODE       = 0755;
constexpr unsigned FILE_CREATE_MODE      = 0644;

// ── Local layout ────────────────────────────────────────────
constexpr const char* SFTPFLOW_DIR       = ".sftpflow";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* CREDENTIALS_FILE   = "credentials";
constexpr const char* DEBUG_LOG_NAME     = "sftpflow_debug.log";
