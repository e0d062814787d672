/**
 * DevJournal - Seed Data
 *
 * Canned developer-journal entries used by the populate command.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "core/EntryStore.hpp"

#include <vector>

namespace devjournal {

/**
 * Entries inserted by `devjournal populate`, in insertion order
 */
const std::vector<EntryDraft>& seedEntries();

} // namespace devjournal
