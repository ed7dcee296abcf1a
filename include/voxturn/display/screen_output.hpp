#pragma once

#include <string>

#include <voxturn/core/context.hpp>

namespace voxturn {

// Receives screen_out payloads (HTML) from the service. Fire-and-forget.
class ScreenOutput {
public:
    virtual ~ScreenOutput() = default;
    virtual void display(const std::string& data) = 0;
};

/**
 * Writes each payload to an HTML file and opens it once with a viewer
 * command (xdg-open by default); later payloads just overwrite the file,
 * so a browser with auto-refresh follows along.
 */
class HtmlFileDisplay : public ScreenOutput {
public:
    HtmlFileDisplay(Context& ctx, std::string path, std::string viewer_cmd = "xdg-open");

    void display(const std::string& data) override;

private:
    Context& ctx_;
    std::string path_;
    std::string viewer_cmd_;
    bool opened_ = false;
};

} // namespace voxturn
