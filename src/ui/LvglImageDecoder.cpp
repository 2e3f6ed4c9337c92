#include "ui/LvglImageDecoder.h"

#include <cstring>

#include "core/ImageHeader.h"

LvglDecodedImage::LvglDecodedImage(lv_draw_buf_t* buffer) : buffer_(buffer) {
  std::memset(&image_, 0, sizeof(image_));
  lv_draw_buf_to_image(buffer_, &image_);
}

LvglDecodedImage::~LvglDecodedImage() {
  lv_image_cache_drop(&image_);
  lv_draw_buf_destroy(buffer_);
}

std::shared_ptr<DecodedImage> LvglImageDecoder::decode(const ImageBytes& bytes,
                                                       std::string* errorMessage) {
  lv_image_dsc_t raw;
  std::memset(&raw, 0, sizeof(raw));
  raw.header.magic = LV_IMAGE_HEADER_MAGIC;
  raw.header.cf = LV_COLOR_FORMAT_RAW;
  ImageGeometry geometry;
  if (probeImageGeometry(bytes.data(), bytes.size(), geometry)) {
    raw.header.w = geometry.width;
    raw.header.h = geometry.height;
  }
  raw.data_size = static_cast<uint32_t>(bytes.size());
  raw.data = bytes.data();

  lv_image_decoder_args_t args;
  std::memset(&args, 0, sizeof(args));
  args.no_cache = true;

  lv_image_decoder_dsc_t dsc;
  if (lv_image_decoder_open(&dsc, &raw, &args) != LV_RESULT_OK) {
    if (errorMessage != nullptr) {
      *errorMessage = "no LVGL decoder accepted the image";
    }
    return nullptr;
  }
  lv_draw_buf_t* copy = dsc.decoded != nullptr ? lv_draw_buf_dup(dsc.decoded) : nullptr;
  lv_image_decoder_close(&dsc);
  if (copy == nullptr) {
    if (errorMessage != nullptr) {
      *errorMessage = "decoded buffer copy failed";
    }
    return nullptr;
  }
  return std::make_shared<LvglDecodedImage>(copy);
}
