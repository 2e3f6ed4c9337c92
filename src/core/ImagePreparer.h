#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "PosterTypes.h"

struct TargetGeometry {
  uint32_t width = 0;
  uint32_t height = 0;
  Orientation orientation = Orientation::kPortrait;
};

// Where a decoded image lands on the target. Scale applies to the image
// before rotation; the scaled, rotated image is centered on a black field.
struct FitPlacement {
  bool rotate90 = false;
  // Footprint on the target after rotation and scaling.
  uint32_t scaledWidth = 0;
  uint32_t scaledHeight = 0;
  int32_t offsetX = 0;
  int32_t offsetY = 0;
  float scale = 1.0f;
  // LVGL zoom units, 256 = 1:1.
  uint32_t lvScale = 256;
};

// Letterbox fit: never crops, keeps aspect ratio, rotates a quarter turn
// when the image's natural orientation differs from the target's.
FitPlacement computeFit(uint32_t imageWidth, uint32_t imageHeight, const TargetGeometry& target);

class DecodedImage {
 public:
  virtual ~DecodedImage() = default;
  virtual uint32_t width() const = 0;
  virtual uint32_t height() const = 0;
};

class ImageDecoder {
 public:
  virtual ~ImageDecoder() = default;
  // nullptr on failure with errorMessage set.
  virtual std::shared_ptr<DecodedImage> decode(const ImageBytes& bytes,
                                               std::string* errorMessage) = 0;
};

struct RenderableSurface {
  std::shared_ptr<DecodedImage> image;
  FitPlacement placement;
};

class ImagePreparer {
 public:
  explicit ImagePreparer(ImageDecoder& decoder) : decoder_(decoder) {}

  bool prepare(const ImageBytes& bytes, const TargetGeometry& target, RenderableSurface& out,
               std::string* errorMessage = nullptr) const;

 private:
  ImageDecoder& decoder_;
};
