#include "log.h"
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <ctype.h>
#include <time.h>

static log_category_t default_category = { "default", LOG_LEVEL_INFO, NULL, 1 };
log_category_t *log_default_category = &default_category;

static int log_timestamps = 0;
static int log_colors = 0;
static FILE *log_owned_file = NULL;   // opened from "output = <path>"

static const char* level_color(int level) {
    if (level >= LOG_LEVEL_ERROR) return "\033[31m";
    if (level >= LOG_LEVEL_WARN) return "\033[33m";
    if (level <= LOG_LEVEL_DEBUG) return "\033[90m";
    return "";
}

const char* log_level_to_string(int level) {
    switch (level) {
        case LOG_LEVEL_DEBUG:  return "DEBUG";
        case LOG_LEVEL_INFO:   return "INFO";
        case LOG_LEVEL_NOTICE: return "NOTICE";
        case LOG_LEVEL_WARN:   return "WARN";
        case LOG_LEVEL_ERROR:  return "ERROR";
        case LOG_LEVEL_FATAL:  return "FATAL";
        default:               return "UNKNOWN";
    }
}

int log_level_from_string(const char *name) {
    if (!name) return -1;
    if (strcasecmp(name, "debug") == 0) return LOG_LEVEL_DEBUG;
    if (strcasecmp(name, "info") == 0) return LOG_LEVEL_INFO;
    if (strcasecmp(name, "notice") == 0) return LOG_LEVEL_NOTICE;
    if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) return LOG_LEVEL_WARN;
    if (strcasecmp(name, "error") == 0) return LOG_LEVEL_ERROR;
    if (strcasecmp(name, "fatal") == 0) return LOG_LEVEL_FATAL;
    return -1;
}

int log_level_enabled(log_category_t *category, const int level) {
    if (!category || !category->enabled) return 0;
    return level >= category->level;
}

void log_set_level(log_category_t *category, int level) {
    if (category) category->level = level;
}

void log_set_output(log_category_t *category, FILE *output) {
    if (category) category->output = output;
}

void log_enable_timestamps(int enable) { log_timestamps = enable; }
void log_enable_colors(int enable) { log_colors = enable; }

static int log_write(log_category_t *category, int level, const char *format, va_list args) {
    if (!log_level_enabled(category, level)) return LOG_OK;
    FILE *out = category->output ? category->output : stderr;

    if (log_timestamps) {
        char stamp[32];
        time_t now = time(NULL);
        struct tm tm_now;
        localtime_r(&now, &tm_now);
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);
        fprintf(out, "%s ", stamp);
    }
    if (log_colors) {
        fprintf(out, "%s[%s]\033[0m ", level_color(level), log_level_to_string(level));
    } else {
        fprintf(out, "[%s] ", log_level_to_string(level));
    }
    if (vfprintf(out, format, args) < 0) return LOG_WRITE_FAIL;
    fputc('\n', out);
    if (level >= LOG_LEVEL_WARN) fflush(out);
    return LOG_OK;
}

#define DEFINE_CLOG(fn, level) \
    int fn(log_category_t *category, const char *format, ...) { \
        va_list args; \
        va_start(args, format); \
        int rc = log_write(category, level, format, args); \
        va_end(args); \
        return rc; \
    }

#define DEFINE_LOG(fn, level) \
    int fn(const char *format, ...) { \
        va_list args; \
        va_start(args, format); \
        int rc = log_write(log_default_category, level, format, args); \
        va_end(args); \
        return rc; \
    }

DEFINE_CLOG(clog_error, LOG_LEVEL_ERROR)
DEFINE_CLOG(clog_warn, LOG_LEVEL_WARN)
DEFINE_CLOG(clog_info, LOG_LEVEL_INFO)
DEFINE_CLOG(clog_debug, LOG_LEVEL_DEBUG)

DEFINE_LOG(log_fatal, LOG_LEVEL_FATAL)
DEFINE_LOG(log_error, LOG_LEVEL_ERROR)
DEFINE_LOG(log_warn, LOG_LEVEL_WARN)
DEFINE_LOG(log_notice, LOG_LEVEL_NOTICE)
DEFINE_LOG(log_info, LOG_LEVEL_INFO)
DEFINE_LOG(log_debug, LOG_LEVEL_DEBUG)

static char* trim_in_place(char *s) {
    while (*s && isspace((unsigned char)*s)) s++;
    char *end = s + strlen(s);
    while (end > s && isspace((unsigned char)end[-1])) end--;
    *end = '\0';
    return s;
}

static int is_on(const char *value) {
    return strcasecmp(value, "on") == 0 || strcasecmp(value, "true") == 0 ||
           strcasecmp(value, "yes") == 0 || strcmp(value, "1") == 0;
}

// Apply one "key = value" setting; returns LOG_OK or a LOG_* error code
static int apply_setting(char *entry) {
    char *line = trim_in_place(entry);
    if (*line == '\0' || *line == '#') return LOG_OK;

    char *eq = strchr(line, '=');
    if (!eq) return LOG_WRONG_FORMAT;
    *eq = '\0';
    char *key = trim_in_place(line);
    char *value = trim_in_place(eq + 1);

    if (strcasecmp(key, "level") == 0) {
        int level = log_level_from_string(value);
        if (level < 0) return LOG_WRONG_FORMAT;
        log_set_level(log_default_category, level);
    } else if (strcasecmp(key, "output") == 0) {
        if (strcasecmp(value, "stderr") == 0) {
            log_set_output(log_default_category, stderr);
        } else if (strcasecmp(value, "stdout") == 0) {
            log_set_output(log_default_category, stdout);
        } else {
            FILE *f = fopen(value, "a");
            if (!f) return LOG_INIT_FAIL;
            if (log_owned_file) fclose(log_owned_file);
            log_owned_file = f;
            log_set_output(log_default_category, f);
        }
    } else if (strcasecmp(key, "timestamps") == 0) {
        log_enable_timestamps(is_on(value));
    } else if (strcasecmp(key, "colors") == 0) {
        log_enable_colors(is_on(value));
    } else if (strcasecmp(key, "enabled") == 0) {
        log_default_category->enabled = is_on(value);
    } else {
        return LOG_WRONG_FORMAT;
    }
    return LOG_OK;
}

int log_parse_config_string(const char *config) {
    if (!config) return LOG_OK;
    size_t len = strlen(config);
    char *copy = (char*)malloc(len + 1);
    if (!copy) return LOG_INIT_FAIL;
    memcpy(copy, config, len + 1);

    int rc = LOG_OK;
    char *save = NULL;
    for (char *entry = strtok_r(copy, ";\n", &save); entry; entry = strtok_r(NULL, ";\n", &save)) {
        int entry_rc = apply_setting(entry);
        if (entry_rc != LOG_OK) rc = entry_rc;
    }
    free(copy);
    return rc;
}

int log_parse_config_file(const char *filename) {
    if (!filename) return LOG_INIT_FAIL;
    FILE *f = fopen(filename, "r");
    if (!f) return LOG_INIT_FAIL;

    int rc = LOG_OK;
    char line[512];
    while (fgets(line, sizeof(line), f)) {
        int line_rc = apply_setting(line);
        if (line_rc != LOG_OK) rc = line_rc;
    }
    fclose(f);
    return rc;
}

int log_init(const char *config) {
    if (!log_default_category->output) log_default_category->output = stderr;
    if (!config || !*config) return LOG_OK;

    // a config naming a readable file is loaded from disk, anything else is inline
    FILE *probe = fopen(config, "r");
    if (probe) {
        fclose(probe);
        return log_parse_config_file(config);
    }
    if (!strchr(config, '=')) return LOG_INIT_FAIL;
    return log_parse_config_string(config);
}

void log_fini(void) {
    if (log_owned_file) {
        fflush(log_owned_file);
        fclose(log_owned_file);
        log_owned_file = NULL;
    }
    log_default_category->output = stderr;
}
