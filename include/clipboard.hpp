#pragma once
#include "clipshare_common.hpp"
#include "logging.hpp"

#include <string>

// -------- OS clipboard capability --------
class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    // has_content is false when the clipboard holds nothing readable
    // (no owner, unsupported type). That is not an error.
    virtual SyncError read(ClipboardObject& out, bool& has_content) = 0;
    virtual SyncError write(const ClipboardObject& obj) = 0;
};

// Host clipboard through wl-copy/wl-paste (Wayland) or xclip (X11)
class SystemClipboard : public ClipboardBackend {
public:
    SystemClipboard();

    SyncError read(ClipboardObject& out, bool& has_content) override;
    SyncError write(const ClipboardObject& obj) override;

private:
    bool wayland_;

    SyncError list_types(std::vector<std::string>& types);
};

std::shared_ptr<ClipboardBackend> make_system_clipboard();
