#include <voxturn/display/screen_output.hpp>

#include <fstream>

#include <voxturn/core/shell.hpp>

namespace voxturn {

HtmlFileDisplay::HtmlFileDisplay(Context& ctx, std::string path, std::string viewer_cmd)
: ctx_(ctx), path_(std::move(path)), viewer_cmd_(std::move(viewer_cmd)) {}

void HtmlFileDisplay::display(const std::string& data) {
  {
    std::ofstream f(path_, std::ios::binary | std::ios::trunc);
    if (!f.good()) {
      ctx_.log().warn("Display", "cannot write " + path_);
      return;
    }
    f << data;
  }
  ctx_.log().debug("Display", "wrote " + std::to_string(data.size()) + " bytes to " + path_);

  if (opened_ || viewer_cmd_.empty()) return;
  opened_ = true;
  std::string cmd = viewer_cmd_ + " " + shellQuote(path_) + " >/dev/null 2>&1 &";
  int ret = runShell(cmd);
  if (ret != 0) ctx_.log().warn("Display", "viewer exited with code " + std::to_string(ret));
}

} // namespace voxturn
