#ifndef FACEWATCH_CLI_COMMANDS_H
#define FACEWATCH_CLI_COMMANDS_H

#include <string>
#include <vector>

namespace facewatch {

/**
 * Command Functions for facewatch CLI
 *
 * Each command function returns:
 *   - 0 on success
 *   - 1 on failure
 */

/**
 * Load a classifier directory and describe the ensemble
 *
 * Prints every classifier (kind, embedding size, source file) and the
 * shared class names with their training counts. Fails when the
 * directory holds inconsistent or unreadable artifacts.
 *
 * @param directory Classifier directory (empty = configured directory)
 * @return 0 on success, 1 on failure
 */
int cmd_classifiers(const std::string& directory = "");

/**
 * Run the recognition pipeline on a still image
 *
 * Arguments: <path> [--debug] [--output <file>] [--classifiers <dir>]
 * Prints one line per detected face; with --output writes the image
 * annotated with boxes and labels.
 *
 * @param args Arguments after "image"
 * @return 0 on success, 1 on failure
 */
int cmd_image(const std::vector<std::string>& args);

/**
 * Print help message
 */
void print_usage();

} // namespace facewatch

#endif // FACEWATCH_CLI_COMMANDS_H
