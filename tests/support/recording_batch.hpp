#pragma once

#include <mapgen/primitives/quad_batch.hpp>

#include <vector>

namespace mapgen::testing {

/// Texture that tracks how many instances are alive
class FakeTexture : public SpriteTexture {
public:
    FakeTexture(uint32_t width, uint32_t height, const Color& color)
        : width_(width), height_(height), color_(color) {
        liveCount()++;
    }
    ~FakeTexture() override { liveCount()--; }

    uint32_t width() const override { return width_; }
    uint32_t height() const override { return height_; }
    const Color& color() const { return color_; }

    static int& liveCount() {
        static int count = 0;
        return count;
    }

private:
    uint32_t width_;
    uint32_t height_;
    Color color_;
};

class FakeTextureProvider : public TextureProvider {
public:
    SpriteTexturePtr createSolidColor(uint32_t width, uint32_t height,
                                      const Color& color) override {
        created++;
        if (failCreation) {
            return nullptr;
        }
        return std::make_unique<FakeTexture>(width, height, color);
    }

    int created = 0;
    bool failCreation = false;
};

/// QuadBatch that records every submission instead of rendering it
class RecordingBatch : public QuadBatch {
public:
    void draw(const QuadDraw& quad) override { draws.push_back(quad); }

    TextureProvider* textureProvider() override {
        return hasProvider ? &provider : nullptr;
    }

    std::vector<QuadDraw> draws;
    FakeTextureProvider provider;
    bool hasProvider = true;
};

} // namespace mapgen::testing
