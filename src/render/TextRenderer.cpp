// Repository: Dossier-render
// Component: Text Renderer
// Purpose: Font measurement and glyph drawing seam between the rasterizer
//          and a concrete font backend.
// Copyright (c) 2025 Dossier

#include "dossier/render/TextRenderer.hpp"

namespace dossier::render {

const char* FontFaceToString(FontFace face) {
  switch (face) {
    case FontFace::kDisplay:
      return "display";
    case FontFace::kMono:
      return "mono";
  }
  return "unknown";
}

}  // namespace dossier::render
