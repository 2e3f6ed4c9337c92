#include "core/ImagePreparer.h"

#include <algorithm>
#include <cmath>
#include <utility>

FitPlacement computeFit(uint32_t imageWidth, uint32_t imageHeight, const TargetGeometry& target) {
  FitPlacement fit;
  if (imageWidth == 0 || imageHeight == 0 || target.width == 0 || target.height == 0) {
    return fit;
  }

  const Orientation natural =
      imageWidth > imageHeight ? Orientation::kLandscape : Orientation::kPortrait;
  fit.rotate90 = natural != target.orientation;

  const uint32_t effW = fit.rotate90 ? imageHeight : imageWidth;
  const uint32_t effH = fit.rotate90 ? imageWidth : imageHeight;
  const double scaleX = static_cast<double>(target.width) / effW;
  const double scaleY = static_cast<double>(target.height) / effH;
  const double scale = std::min(scaleX, scaleY);

  const auto fitAxis = [scale](uint32_t length, uint32_t limit) {
    const long scaled = std::lround(length * scale);
    return static_cast<uint32_t>(std::clamp<long>(scaled, 1, static_cast<long>(limit)));
  };
  fit.scaledWidth = fitAxis(effW, target.width);
  fit.scaledHeight = fitAxis(effH, target.height);
  fit.offsetX = static_cast<int32_t>((target.width - fit.scaledWidth) / 2);
  fit.offsetY = static_cast<int32_t>((target.height - fit.scaledHeight) / 2);
  fit.scale = static_cast<float>(scale);
  fit.lvScale = static_cast<uint32_t>(std::max<long>(1, std::lround(scale * 256.0)));
  return fit;
}

bool ImagePreparer::prepare(const ImageBytes& bytes, const TargetGeometry& target,
                            RenderableSurface& out, std::string* errorMessage) const {
  if (bytes.empty()) {
    if (errorMessage != nullptr) {
      *errorMessage = "no image bytes";
    }
    return false;
  }
  std::shared_ptr<DecodedImage> image = decoder_.decode(bytes, errorMessage);
  if (image == nullptr) {
    return false;
  }
  if (image->width() == 0 || image->height() == 0) {
    if (errorMessage != nullptr) {
      *errorMessage = "decoded image has zero size";
    }
    return false;
  }
  out.placement = computeFit(image->width(), image->height(), target);
  out.image = std::move(image);
  return true;
}
