#pragma once

#include <memory>
#include <string>

#include "core/ImagePreparer.h"
#include "lvgl.h"

// A decoded image in LVGL's native draw buffer. Owns the buffer.
class LvglDecodedImage : public DecodedImage {
 public:
  explicit LvglDecodedImage(lv_draw_buf_t* buffer);
  ~LvglDecodedImage() override;

  LvglDecodedImage(const LvglDecodedImage&) = delete;
  LvglDecodedImage& operator=(const LvglDecodedImage&) = delete;

  uint32_t width() const override { return image_.header.w; }
  uint32_t height() const override { return image_.header.h; }
  const lv_image_dsc_t* source() const { return &image_; }

 private:
  lv_draw_buf_t* buffer_;
  lv_image_dsc_t image_;
};

// Decodes PNG/JPEG bytes through the decoders LVGL was built with.
class LvglImageDecoder : public ImageDecoder {
 public:
  std::shared_ptr<DecodedImage> decode(const ImageBytes& bytes,
                                       std::string* errorMessage) override;
};
