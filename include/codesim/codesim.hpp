#pragma once

/**
 * codesim
 *
 * Token-level similarity between two collections of source files, resistant
 * to identifier renaming and literal changes.
 */

#include <codesim/types.hpp>
#include <codesim/comparator.hpp>
#include <codesim/file_collector.hpp>
#include <codesim/config_file.hpp>
#include <codesim/report_writer.hpp>
#include <codesim/language_detector.hpp>
