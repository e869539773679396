#include "ffweave/nodes/video/Upload.h"

#include <stdexcept>

namespace ffweave {

Upload::Upload(std::string hardware, std::string device)
  : Filter({StreamKind::Video}, {StreamKind::Video}),
    hardware_(std::move(hardware)),
    device_(std::move(device)) {
  if (hardware_.empty()) throw std::invalid_argument("Upload: hardware name is empty");
}

std::vector<FilterParam> Upload::params() const {
  return {{"extra_hw_frames", static_cast<int64_t>(kExtraHwFrames)}, {"device", device_}};
}

std::shared_ptr<Filter> Upload::clone() const {
  return std::make_shared<Upload>(hardware_, device_);
}

std::vector<Meta> Upload::transform(const std::vector<Meta>& metas) const {
  Meta out = metas.front();
  out.device = Device{hardware_, device_};
  return {out};
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Upload> Upload(std::string hardware, std::string device) {
  return std::make_shared<ffweave::Upload>(std::move(hardware), std::move(device));
}

} // namespace ffweave::nodes
