#include "file.h"
#include "log.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>

// Slurp an open stream; returns NULL on allocation or read error
static char* read_stream(FILE *file, const char *name) {
    size_t cap = 4096;
    size_t len = 0;
    char *buf = (char*)malloc(cap);
    if (!buf) {
        log_error("read_text_file: out of memory reading %s", name);
        return NULL;
    }

    size_t n;
    while ((n = fread(buf + len, 1, cap - len - 1, file)) > 0) {
        len += n;
        if (len + 1 >= cap) {
            char *grown = (char*)realloc(buf, cap * 2);
            if (!grown) {
                log_error("read_text_file: out of memory reading %s", name);
                free(buf);
                return NULL;
            }
            buf = grown;
            cap *= 2;
        }
    }
    if (ferror(file)) {
        log_error("read_text_file: error reading %s: %s", name, strerror(errno));
        free(buf);
        return NULL;
    }
    buf[len] = '\0';
    return buf;
}

char* read_text_file(const char *filename) {
    if (!filename) return NULL;
    FILE *file = fopen(filename, "rb");
    if (!file) {
        log_error("read_text_file: cannot open %s: %s", filename, strerror(errno));
        return NULL;
    }
    char *content = read_stream(file, filename);
    fclose(file);
    return content;
}

char* read_text_stdin(void) {
    return read_stream(stdin, "<stdin>");
}
