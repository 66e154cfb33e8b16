 /**
  * @file    main.cpp
  * @brief   Web Image Tool - CLI Entry Point
  * @date    2026.10.17
  * @license MIT
  *
  * @details
  * Resizes images and overlays image or text watermarks for web publishing.
  *
  * Watermark Placement:
  *   Unless a position is given, every corner and the bottom center are
  *   scored by luminance standard deviation and the flattest one is used.
  *   Overlays on bright regions are inverted to keep contrast.
  *
  * Usage:
  *   WebImageTool -i photo.jpg -o web/photo.jpg -L 2000 -w logo.png
  *   WebImageTool -i photo.jpg -t "example.com" --copyright --capture-date 2024:06:01
  *   WebImageTool -i photos/ -o web/ --config webimage.ini
  */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return wit::cli::run(argc, argv);
}
