#pragma once

#ifndef G_LOG_DOMAIN
#define G_LOG_DOMAIN "bully-kv"
#endif

#include <glib.h>

// printf style logging over g_log, debug output is enabled by G_MESSAGES_DEBUG=all
#define LOG_DEBUG(format, ...) g_log(G_LOG_DOMAIN, G_LOG_LEVEL_DEBUG, "[%s:%d] " format, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(format, ...) g_log(G_LOG_DOMAIN, G_LOG_LEVEL_INFO, "[%s:%d] " format, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(format, ...) g_log(G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "[%s:%d] " format, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(format, ...) g_log(G_LOG_DOMAIN, G_LOG_LEVEL_CRITICAL, "[%s:%d] " format, __FILE__, __LINE__, ##__VA_ARGS__)

// G_LOG_LEVEL_ERROR is always fatal, the process aborts after the message is written
#define LOG_FATAL(format, ...) g_log(G_LOG_DOMAIN, G_LOG_LEVEL_ERROR, "[%s:%d] " format, __FILE__, __LINE__, ##__VA_ARGS__)
