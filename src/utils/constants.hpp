#pragma once

#define DEFAULT_CADDYFILE_PATH "/etc/caddy/Caddyfile"
#define DEFAULT_ADMIN_URL "http://localhost:2019"
#define DEFAULT_CADDY_BINARY "caddy"

#define DEFAULT_VALIDATE_TIMEOUT_SEC 30
#define DEFAULT_ADMIN_TIMEOUT_SEC 30
#define DEFAULT_RELOAD_TIMEOUT_SEC 10

#define DEFAULT_INDENT "\t"
#define DEFAULT_CA_ID "local"
#define CADDYFILE_SOURCE_NAME "Caddyfile"
#define CADDYFILE_CONTENT_TYPE "text/caddyfile"
#define CADDYFILE_FILE_MODE 0644

#define CRLF "\r\n"
#define HTTP_VERSION "HTTP/1.1"
#define READ_BUF_SIZE 4096
#define MAX_EVENTS 8

#define EXIT_NOT_FOUND 127  // Standard shell exit code for "command not found"

// Exit codes of the command-line tool
#define EXIT_OK 0
#define EXIT_USAGE 1
#define EXIT_INVALID 2
#define EXIT_UNAVAILABLE 3
#define EXIT_RELOAD_REJECTED 4
#define EXIT_CADDYFILE_NOT_FOUND 5
