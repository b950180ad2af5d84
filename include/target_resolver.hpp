#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * Derive a local file name from a URL.
 *
 * Query and fragment are dropped and the last path segment is kept, with
 * runs of characters other than [A-Za-z0-9_.] replaced by '_'. For URLs
 * ending in '/', everything after "://" is used instead and '.' is replaced
 * too ("https://example.com/page/1/" -> "example_com_page_1").
 *
 * @return Name of at most 100 characters, "download" if nothing usable is left
 */
std::string filenameFromUrl(const std::string &url);

/**
 * Decide where a download is saved.
 *
 * @param url Source URL (used for the file name when needed)
 * @param target Explicit target; an existing directory receives the URL's
 *               file name, anything else is used as the file path
 * @param downloadDir Directory used when no target was given
 */
std::filesystem::path resolveTarget(const std::string &url,
                                    const std::optional<std::string> &target,
                                    const std::filesystem::path &downloadDir);

/**
 * Read a newline-separated URL list. Blank lines and lines starting with '#'
 * are skipped; surrounding whitespace is trimmed.
 *
 * @throws std::runtime_error if the file cannot be read
 */
std::vector<std::string> readUrlList(const std::filesystem::path &path);
