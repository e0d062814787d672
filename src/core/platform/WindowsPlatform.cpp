/**
 * DevJournal - Platform Implementation (Windows)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_WINDOWS

#include "Platform.hpp"

#include <ShlObj.h>
#include <windows.h>

namespace devjournal {

namespace {

std::filesystem::path getKnownFolderPath(REFKNOWNFOLDERID folderId) {
    PWSTR path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(folderId, 0, nullptr, &path))) {
        std::filesystem::path result(path);
        CoTaskMemFree(path);
        return result;
    }
    return {};
}

}  // namespace

std::filesystem::path Platform::getConfigPath() {
    auto appData = getKnownFolderPath(FOLDERID_RoamingAppData);
    if (!appData.empty()) {
        return appData / "devjournal";
    }
    return std::filesystem::path("devjournal");
}

std::filesystem::path Platform::getDataPath() {
    auto localAppData = getKnownFolderPath(FOLDERID_LocalAppData);
    if (!localAppData.empty()) {
        return localAppData / "devjournal";
    }
    return std::filesystem::path("devjournal");
}

} // namespace devjournal

#endif // PLATFORM_WINDOWS
