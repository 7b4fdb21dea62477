/**
 * @file test_image_loader.cpp
 * @brief Unit tests for locating and decoding source images
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tessera/io/image_loader.h>
#include <tessera/errors.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace tessera;
using Catch::Matchers::WithinAbs;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed when the test case ends
struct ScratchDir {
    fs::path path;

    explicit ScratchDir(const std::string& name)
        : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// Binary PPM: red, green / blue, white
void writeSwatch(const fs::path& file) {
    std::ofstream out(file, std::ios::binary);
    out << "P6\n2 2\n255\n";
    const unsigned char rgb[] = {
        255, 0, 0,    0, 255, 0,
        0, 0, 255,    255, 255, 255,
    };
    out.write(reinterpret_cast<const char*>(rgb), sizeof(rgb));
}

} // namespace

TEST_CASE("Default image directories", "[image_loader]") {
    const auto& dirs = io::defaultImageDirs();
    REQUIRE(dirs.size() == 3);
    REQUIRE(dirs.front() == "images");
}

TEST_CASE("resolvePath searches the given directories", "[image_loader]") {
    ScratchDir scratch("tessera_resolve_test");
    writeSwatch(scratch.path / "swatch.ppm");

    SECTION("relative name found through a search directory") {
        std::string resolved = io::resolvePath("swatch.ppm", {"no/such/dir", scratch.path.string()});
        REQUIRE_FALSE(resolved.empty());
        REQUIRE(fs::equivalent(resolved, scratch.path / "swatch.ppm"));
    }

    SECTION("absolute path to an existing file") {
        const std::string file = (scratch.path / "swatch.ppm").string();
        REQUIRE(fs::equivalent(io::resolvePath(file, {}), file));
    }

    SECTION("missing files resolve to an empty string") {
        REQUIRE(io::resolvePath("missing.ppm", {scratch.path.string()}).empty());
        REQUIRE(io::resolvePath((scratch.path / "missing.ppm").string(), {}).empty());
        REQUIRE(io::resolvePath("", {scratch.path.string()}).empty());
    }

    SECTION("directories are not images") {
        REQUIRE(io::resolvePath(scratch.path.string(), {}).empty());
    }
}

TEST_CASE("loadImage decodes to RGBA", "[image_loader]") {
    ScratchDir scratch("tessera_load_test");
    writeSwatch(scratch.path / "swatch.ppm");

    io::ImageData image = io::loadImage("swatch.ppm", {scratch.path.string()});
    REQUIRE(image.valid());
    REQUIRE(image.width == 2);
    REQUIRE(image.height == 2);
    REQUIRE(image.rgba.size() == 16);
    // Opaque alpha is added for three-channel files
    REQUIRE(image.rgba[3] == 255);
    REQUIRE(image.rgba[8] == 0);
    REQUIRE(image.rgba[10] == 255);

    PixelBuffer buffer = io::toPixelBuffer(image);
    REQUIRE(buffer.at(0, 0) == Color(1.0f, 0.0f, 0.0f));
    REQUIRE(buffer.at(1, 0) == Color(0.0f, 1.0f, 0.0f));
    REQUIRE(buffer.at(0, 1) == Color(0.0f, 0.0f, 1.0f));
    REQUIRE(buffer.at(1, 1) == Color::white());
}

TEST_CASE("loadImage failures return an invalid image", "[image_loader][errors]") {
    SECTION("missing file") {
        io::ImageData image = io::loadImage("/nonexistent/tessera/image.png");
        REQUIRE_FALSE(image.valid());
        REQUIRE(image.rgba.empty());
    }

    SECTION("undecodable file") {
        ScratchDir scratch("tessera_corrupt_test");
        {
            std::ofstream out(scratch.path / "broken.png", std::ios::binary);
            out << "not an image";
        }
        REQUIRE_FALSE(io::loadImage("broken.png", {scratch.path.string()}).valid());
    }
}

TEST_CASE("toPixelBuffer normalizes and drops alpha", "[image_loader]") {
    io::ImageData image;
    image.width = 2;
    image.height = 1;
    image.rgba = {255, 51, 0, 10,   0, 102, 255, 200};

    PixelBuffer buffer = io::toPixelBuffer(image);
    REQUIRE(buffer.width() == 2);
    REQUIRE(buffer.height() == 1);
    REQUIRE(buffer.samples().size() == 6);
    REQUIRE_THAT(buffer.channel(0, 0, 0), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(buffer.channel(0, 0, 1), WithinAbs(0.2, 1e-6));
    REQUIRE_THAT(buffer.channel(1, 0, 1), WithinAbs(0.4, 1e-6));
    REQUIRE_THAT(buffer.channel(1, 0, 2), WithinAbs(1.0, 1e-6));
}

TEST_CASE("toPixelBuffer rejects invalid images", "[image_loader][errors]") {
    SECTION("empty image") {
        REQUIRE_THROWS_AS(io::toPixelBuffer(io::ImageData{}), InvalidBufferError);
    }

    SECTION("byte count does not match the dimensions") {
        io::ImageData image;
        image.width = 2;
        image.height = 2;
        image.rgba.assign(12, 0);
        REQUIRE_FALSE(image.valid());
        REQUIRE_THROWS_AS(io::toPixelBuffer(image), InvalidBufferError);
    }
}
