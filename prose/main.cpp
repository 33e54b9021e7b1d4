#include "prose.hpp"
#include "normalize.hpp"
#include "utf_string.hpp"
#include "format/format.hpp"
#include <unistd.h>  // for access
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include "../lib/log.h"
#include "../lib/file.h"

static void print_help(const char* prog) {
    printf("Prose Formatter v1.0\n\n");
    printf("Usage: %s [options] [file|-]\n", prog);
    printf("\nReads model-generated text (stdin when no file or '-') and prints its\n");
    printf("document structure.\n");
    printf("\nOptions:\n");
    printf("  -f, --format <fmt>     Output format: text (default) or json\n");
    printf("  -s, --style <token>    Base style token attached to every text span\n");
    printf("  -m, --max-bytes <n>    Cut input longer than n bytes (0 = no limit)\n");
    printf("  -n, --normalize-only   Print the normalized text and stop\n");
    printf("  -h, --help             Show this help message\n");
    printf("\nLogging is configured from ./log.conf when present.\n");
}

int main(int argc, char* argv[]) {
    // Initialize logging system with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");
    log_debug("main() started with %d arguments", argc);

    const char* input_file = NULL;
    const char* output_format = "text";
    bool normalize_only = false;
    prose::FormatOptions options;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            log_fini();
            return 0;
        } else if (strcmp(argv[i], "-f") == 0 || strcmp(argv[i], "--format") == 0) {
            if (i + 1 < argc) {
                output_format = argv[++i];
            } else {
                fprintf(stderr, "Error: -f option requires a format argument\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--style") == 0) {
            if (i + 1 < argc) {
                options.base_style = argv[++i];
            } else {
                fprintf(stderr, "Error: -s option requires a style token\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--max-bytes") == 0) {
            if (i + 1 < argc) {
                char* end = NULL;
                const char* value = argv[++i];
                errno = 0;
                unsigned long long limit = strtoull(value, &end, 10);
                if (!*value || *end || value[0] == '-' || errno == ERANGE ||
                    limit > (unsigned long long)SIZE_MAX) {
                    fprintf(stderr, "Error: invalid byte limit '%s'\n", value);
                    return 1;
                }
                options.max_input_bytes = (size_t)limit;
            } else {
                fprintf(stderr, "Error: -m option requires a byte count\n");
                return 1;
            }
        } else if (strcmp(argv[i], "-n") == 0 || strcmp(argv[i], "--normalize-only") == 0) {
            normalize_only = true;
        } else if (strcmp(argv[i], "-") == 0 || argv[i][0] != '-') {
            if (input_file == NULL) {
                input_file = argv[i];
            } else {
                fprintf(stderr, "Error: Multiple input files not supported\n");
                return 1;
            }
        } else {
            fprintf(stderr, "Error: Unknown option '%s'\n", argv[i]);
            fprintf(stderr, "Use '%s --help' for more information\n", argv[0]);
            return 1;
        }
    }

    bool as_json = strcmp(output_format, "json") == 0;
    if (!as_json && strcmp(output_format, "text") != 0) {
        fprintf(stderr, "Error: Unknown output format '%s' (expected text or json)\n", output_format);
        return 1;
    }

    bool from_stdin = input_file == NULL || strcmp(input_file, "-") == 0;
    char* content = from_stdin ? read_text_stdin() : read_text_file(input_file);
    if (!content) {
        fprintf(stderr, "Error: Failed to read input from %s\n", from_stdin ? "stdin" : input_file);
        log_fini();
        return 1;
    }
    log_debug("read %zu bytes from %s", strlen(content), from_stdin ? "stdin" : input_file);

    if (normalize_only) {
        std::string input(content);
        if (options.max_input_bytes > 0 && input.size() > options.max_input_bytes) {
            log_warn("input of %zu bytes cut to %zu", input.size(), options.max_input_bytes);
            input = prose::utf8_truncate(input, options.max_input_bytes);
        }
        std::string normalized = prose::normalize(input);
        fputs(normalized.c_str(), stdout);
    } else {
        prose::Document doc = prose::format(std::string(content), options);
        std::string rendered = as_json ? prose::format_document_json(doc)
                                       : prose::format_document_text(doc);
        fputs(rendered.c_str(), stdout);
    }

    free(content);
    log_fini();
    return 0;
}
