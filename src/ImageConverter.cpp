/*============================================================================
  ImageConverter.cpp  –  part of file-forge
  --------------------------------------------------------------------------
  Raster → raster through OpenCV imgcodecs. One pass covers the image
  commands: re-encode to another format (convert), re-encode with a lower
  quality / higher deflate level (compress), fit into max_width×max_height
  (resize) and rotation about the centre (rotate).

  quality only affects lossy targets (JPEG, WEBP). Lossless targets ignore
  it and report a warning instead of failing.
============================================================================*/

#include "file_forge/ImageConverter.hpp"
#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeError.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace file_forge {

// ─────────────────────── geometry ──────────────────────────────────────────
ImageSize targetSize(ImageSize src, int maxWidth, int maxHeight, bool maintainAspect)
{
    if (maxWidth <= 0 && maxHeight <= 0) return src;

    if (!maintainAspect) {
        if (maxWidth <= 0 || maxHeight <= 0)
            throw ForgeError(ErrorKind::InvalidOption,
                             "both max_width and max_height are required when "
                             "maintain_aspect is false");
        return {maxWidth, maxHeight};
    }

    double ratio = 0;
    if (maxWidth > 0 && maxHeight > 0)
        ratio = std::min(double(maxWidth) / src.width, double(maxHeight) / src.height);
    else if (maxWidth > 0)
        ratio = double(maxWidth) / src.width;
    else
        ratio = double(maxHeight) / src.height;

    auto scaled = [ratio](int v) { return std::max(1, static_cast<int>(std::lround(v * ratio))); };
    ImageSize out{scaled(src.width), scaled(src.height)};

    // the side the caller gave is exact, only the other one is derived
    if (maxHeight <= 0) out.width  = maxWidth;
    if (maxWidth <= 0)  out.height = maxHeight;
    return out;
}

// counter-clockwise, white fill; expand grows the canvas to keep the corners
static cv::Mat rotate(const cv::Mat& img, double degrees, bool expand)
{
    const cv::Point2f centre((img.cols - 1) / 2.f, (img.rows - 1) / 2.f);
    cv::Mat m = cv::getRotationMatrix2D(centre, degrees, 1.0);
    cv::Size dsize = img.size();

    if (expand) {
        const cv::Rect2f bb = cv::RotatedRect(cv::Point2f(), cv::Size2f(img.size()),
                                              static_cast<float>(degrees)).boundingRect2f();
        dsize = cv::Size(std::max(1, cvRound(bb.width)), std::max(1, cvRound(bb.height)));
        m.at<double>(0, 2) += dsize.width  / 2.0 - centre.x - 0.5;
        m.at<double>(1, 2) += dsize.height / 2.0 - centre.y - 0.5;
    }

    cv::Mat out;
    cv::warpAffine(img, out, m, dsize, cv::INTER_LINEAR, cv::BORDER_CONSTANT,
                   cv::Scalar(255, 255, 255, 255));
    return out;
}

// BGRA → BGR composited over white (8-bit input)
static cv::Mat flattenOnWhite(const cv::Mat& bgra)
{
    cv::Mat f;
    bgra.convertTo(f, CV_32F, 1.0 / 255);
    std::vector<cv::Mat> ch;
    cv::split(f, ch);
    const cv::Mat alpha = ch[3];
    for (int i = 0; i < 3; ++i)
        ch[i] = ch[i].mul(alpha) + (1.0 - alpha);
    ch.resize(3);

    cv::Mat bgr, out;
    cv::merge(ch, bgr);
    bgr.convertTo(out, CV_8U, 255);
    return out;
}

static cv::Mat to8Bit(const cv::Mat& img)
{
    if (img.depth() == CV_8U) return img;
    cv::Mat out;
    if (img.depth() == CV_16U)
        img.convertTo(out, CV_8U, 1.0 / 257);
    else
        img.convertTo(out, CV_8U, 255);
    return out;
}

// ─────────────────────── IConverter ────────────────────────────────────────
std::vector<OptionRule> ImageConverter::optionRules() const
{
    using T = OptionRule::Type;
    return {
        {"quality",         T::Integer, 1, 100},
        {"max_width",       T::Integer, 1, 1 << 20},
        {"max_height",      T::Integer, 1, 1 << 20},
        {"maintain_aspect", T::Bool},
        {"compression",     T::Integer, 0, 9},
        {"rotate",          T::Real},
        {"expand",          T::Bool},
    };
}

bool ImageConverter::probe(const std::vector<char>& head) const
{
    return sniffMagic(head) == FileKind::ImageRaster;
}

ConversionResult ImageConverter::convert(const std::string&       inPath,
                                         const std::string&       outPath,
                                         const Options&           opts,
                                         const ConversionContext& ctx)
{
    ConversionResult result;
    result.outputPath = outPath;

    // 1. ─────────────── configuration ─────────────────────────────────────
    const std::string format = normalizeFormat(std::filesystem::path(outPath).extension().string());
    const bool lossy  = isLossyImageFormat(format);
    const int quality = opts.integer("quality", config_.convertQuality);
    const int maxW    = opts.integer("max_width", 0);
    const int maxH    = opts.integer("max_height", 0);
    const bool keep   = opts.flag("maintain_aspect", true);

    if (opts.has("quality") && !lossy)
        result.warnings.push_back("quality is ignored for lossless ." + format + " output");
    if (opts.has("compression") && format != "png")
        result.warnings.push_back("compression only applies to .png output");

    // 2. ─────────────── decode ────────────────────────────────────────────
    cv::Mat img = cv::imread(inPath, cv::IMREAD_UNCHANGED);
    if (img.empty())
        throw std::runtime_error("cannot decode image " + inPath);
    ctx.checkpoint();

    // 3. ─────────────── geometry ──────────────────────────────────────────
    const ImageSize size = targetSize({img.cols, img.rows}, maxW, maxH, keep);
    if (size.width != img.cols || size.height != img.rows) {
        const bool shrinking = size.width < img.cols && size.height < img.rows;
        cv::resize(img, img, cv::Size(size.width, size.height), 0, 0,
                   shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4);
    }
    if (opts.has("rotate"))
        img = rotate(img, opts.real("rotate", 0), opts.flag("expand", true));
    ctx.checkpoint();

    // 4. ─────────────── target constraints ────────────────────────────────
    std::vector<int> params;
    if (format == "jpg" || format == "jpeg" || format == "jpe") {
        img = to8Bit(img);
        if (img.channels() == 4) img = flattenOnWhite(img);
        params = {cv::IMWRITE_JPEG_QUALITY, quality, cv::IMWRITE_JPEG_OPTIMIZE, 1};
    } else if (format == "webp") {
        img = to8Bit(img);
        params = {cv::IMWRITE_WEBP_QUALITY, quality};
    } else if (format == "png") {
        params = {cv::IMWRITE_PNG_COMPRESSION, opts.integer("compression", config_.pngCompression)};
    }

    // 5. ─────────────── encode + publish ──────────────────────────────────
    std::vector<unsigned char> encoded;
    if (!cv::imencode("." + format, img, encoded, params))
        throw std::runtime_error("OpenCV cannot encode ." + format + " images");
    ctx.checkpoint();

    AtomicFile file(outPath);
    file.write(encoded);
    result.bytesWritten = file.commit(ctx);
    return result;
}

} // namespace file_forge
