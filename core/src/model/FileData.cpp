#include "modelcheck/model/FileData.hpp"

namespace modelcheck::model {

    bool isSrgb(NutexbFormat format) {
        switch (format) {
            case NutexbFormat::R8G8B8A8Srgb:
            case NutexbFormat::B8G8R8A8Srgb:
            case NutexbFormat::BC1Srgb:
            case NutexbFormat::BC2Srgb:
            case NutexbFormat::BC3Srgb:
            case NutexbFormat::BC7Srgb:
                return true;
            default:
                return false;
        }
    }

    const char* toString(NutexbFormat format) {
        switch (format) {
            case NutexbFormat::R8Unorm: return "R8Unorm";
            case NutexbFormat::R8G8B8A8Unorm: return "R8G8B8A8Unorm";
            case NutexbFormat::R8G8B8A8Srgb: return "R8G8B8A8Srgb";
            case NutexbFormat::R32G32B32A32Float: return "R32G32B32A32Float";
            case NutexbFormat::B8G8R8A8Unorm: return "B8G8R8A8Unorm";
            case NutexbFormat::B8G8R8A8Srgb: return "B8G8R8A8Srgb";
            case NutexbFormat::BC1Unorm: return "BC1Unorm";
            case NutexbFormat::BC1Srgb: return "BC1Srgb";
            case NutexbFormat::BC2Unorm: return "BC2Unorm";
            case NutexbFormat::BC2Srgb: return "BC2Srgb";
            case NutexbFormat::BC3Unorm: return "BC3Unorm";
            case NutexbFormat::BC3Srgb: return "BC3Srgb";
            case NutexbFormat::BC4Unorm: return "BC4Unorm";
            case NutexbFormat::BC4Snorm: return "BC4Snorm";
            case NutexbFormat::BC5Unorm: return "BC5Unorm";
            case NutexbFormat::BC5Snorm: return "BC5Snorm";
            case NutexbFormat::BC6Ufloat: return "BC6Ufloat";
            case NutexbFormat::BC6Sfloat: return "BC6Sfloat";
            case NutexbFormat::BC7Unorm: return "BC7Unorm";
            case NutexbFormat::BC7Srgb: return "BC7Srgb";
        }
        return "Unknown";
    }

    material::TextureDimension textureDimension(const NutexbFile& nutexb) {
        if (nutexb.footer.depth > 1) {
            return material::TextureDimension::Texture3d;
        }
        if (nutexb.footer.layerCount == 6) {
            return material::TextureDimension::TextureCube;
        }
        return material::TextureDimension::Texture2d;
    }

}
