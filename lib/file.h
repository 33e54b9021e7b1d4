#ifndef FILE_H
#define FILE_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Read a whole text file into a malloc'd, NUL-terminated buffer.
// Returns NULL (and logs the cause) when the file cannot be read.
// The caller frees the result.
char* read_text_file(const char *filename);

// Read all of stdin the same way; returns NULL on read failure
char* read_text_stdin(void);

#ifdef __cplusplus
}
#endif

#endif // FILE_H
