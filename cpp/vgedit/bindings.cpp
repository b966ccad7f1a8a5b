#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "vgedit/editor.h"

#ifdef EMSCRIPTEN
namespace {

using vgedit::Editor;

// Byte offsets into WASM linear memory plus float counts, valid until the
// next renderFrame call.
struct FrameMeta {
    std::uintptr_t segmentPtr;
    std::uint32_t segmentFloats;
    std::uintptr_t polylinePtr;
    std::uint32_t polylineFloats;
    std::uint32_t polylineCount;
    std::uintptr_t arcPtr;
    std::uint32_t arcFloats;
    std::uint32_t drawn;
    std::uint32_t culled;
};

FrameMeta getFrameMeta(const Editor& editor) {
    const vgedit::LineBufferSink& frame = editor.frame();
    return FrameMeta{
        reinterpret_cast<std::uintptr_t>(frame.segmentVertices().data()),
        static_cast<std::uint32_t>(frame.segmentVertices().size()),
        reinterpret_cast<std::uintptr_t>(frame.polylineVertices().data()),
        static_cast<std::uint32_t>(frame.polylineVertices().size()),
        static_cast<std::uint32_t>(frame.polylineCount()),
        reinterpret_cast<std::uintptr_t>(frame.arcData().data()),
        static_cast<std::uint32_t>(frame.arcData().size()),
        editor.frameStats().drawn,
        editor.frameStats().culled,
    };
}

vgedit::PolylineRange getPolylineRange(const Editor& editor, std::uint32_t index) {
    const auto& ranges = editor.frame().polylineRanges();
    if (index >= ranges.size()) return vgedit::PolylineRange{0, 0, false, false};
    return ranges[index];
}

vgedit::EngineError removeObject(Editor& editor, std::uint32_t index) {
    return editor.removeObjects({static_cast<std::size_t>(index)});
}

vgedit::EngineError navigate(Editor& editor, Editor::NavCommand command, const std::vector<std::uint32_t>& selection) {
    std::vector<std::size_t> indices(selection.begin(), selection.end());
    return editor.navigate(command, indices);
}

std::uint32_t getLastParseLine(const Editor& editor) {
    return static_cast<std::uint32_t>(editor.lastDiagnostic().lineNumber);
}

std::string getLastParseReason(const Editor& editor) {
    return editor.lastDiagnostic().reason;
}

void setAbsolutePivot(Editor& editor, double x, double y) {
    editor.setAbsolutePivot(vgedit::Vec2{x, y});
}

} // namespace

EMSCRIPTEN_BINDINGS(vgedit_module) {
    emscripten::enum_<vgedit::EngineError>("EngineError")
        .value("Ok", vgedit::EngineError::Ok)
        .value("InvalidOperation", vgedit::EngineError::InvalidOperation)
        .value("ParseError", vgedit::EngineError::ParseError)
        .value("ValidationError", vgedit::EngineError::ValidationError)
        .value("UnsupportedAlgorithm", vgedit::EngineError::UnsupportedAlgorithm)
        .value("IndexOutOfRange", vgedit::EngineError::IndexOutOfRange)
        .value("IoError", vgedit::EngineError::IoError);

    emscripten::enum_<vgedit::LineClipAlgorithm>("LineClipAlgorithm")
        .value("CohenSutherland", vgedit::LineClipAlgorithm::CohenSutherland)
        .value("LiangBarsky", vgedit::LineClipAlgorithm::LiangBarsky)
        .value("Skala", vgedit::LineClipAlgorithm::Skala)
        .value("NichollLeeNicholl", vgedit::LineClipAlgorithm::NichollLeeNicholl);

    emscripten::enum_<vgedit::RotationReference>("RotationReference")
        .value("Center", vgedit::RotationReference::Center)
        .value("Origin", vgedit::RotationReference::Origin)
        .value("Absolute", vgedit::RotationReference::Absolute);

    emscripten::enum_<vgedit::curve::CurveBasis>("CurveBasis")
        .value("Bezier", vgedit::curve::CurveBasis::Bezier)
        .value("BSpline", vgedit::curve::CurveBasis::BSpline)
        .value("Polyline", vgedit::curve::CurveBasis::Polyline);

    emscripten::enum_<Editor::NavCommand>("NavCommand")
        .value("MoveUp", Editor::NavCommand::MoveUp)
        .value("MoveDown", Editor::NavCommand::MoveDown)
        .value("MoveLeft", Editor::NavCommand::MoveLeft)
        .value("MoveRight", Editor::NavCommand::MoveRight)
        .value("RotateLeft", Editor::NavCommand::RotateLeft)
        .value("RotateRight", Editor::NavCommand::RotateRight)
        .value("ZoomIn", Editor::NavCommand::ZoomIn)
        .value("ZoomOut", Editor::NavCommand::ZoomOut);

    emscripten::enum_<Editor::ScrollDirection>("ScrollDirection")
        .value("Up", Editor::ScrollDirection::Up)
        .value("Down", Editor::ScrollDirection::Down);

    emscripten::value_object<vgedit::Vec2>("Vec2")
        .field("x", &vgedit::Vec2::x)
        .field("y", &vgedit::Vec2::y);

    emscripten::value_object<vgedit::PolylineRange>("PolylineRange")
        .field("offset", &vgedit::PolylineRange::offset)
        .field("count", &vgedit::PolylineRange::count)
        .field("closed", &vgedit::PolylineRange::closed)
        .field("filled", &vgedit::PolylineRange::filled);

    emscripten::value_object<FrameMeta>("FrameMeta")
        .field("segmentPtr", &FrameMeta::segmentPtr)
        .field("segmentFloats", &FrameMeta::segmentFloats)
        .field("polylinePtr", &FrameMeta::polylinePtr)
        .field("polylineFloats", &FrameMeta::polylineFloats)
        .field("polylineCount", &FrameMeta::polylineCount)
        .field("arcPtr", &FrameMeta::arcPtr)
        .field("arcFloats", &FrameMeta::arcFloats)
        .field("drawn", &FrameMeta::drawn)
        .field("culled", &FrameMeta::culled);

    emscripten::register_vector<vgedit::Vec2>("VectorVec2");
    emscripten::register_vector<std::uint32_t>("VectorUInt32");

    emscripten::class_<Editor>("Editor")
        .constructor<>()
        .function("getLastError", &Editor::lastError)
        .function("getLastParseLine", &getLastParseLine)
        .function("getLastParseReason", &getLastParseReason)
        .function("getObjectCount", &Editor::objectCount)
        .function("setViewportSize", &Editor::setViewportSize)
        .function("setClipAlgorithm", &Editor::setClipAlgorithm)
        .function("getClipAlgorithm", &Editor::clipAlgorithm)
        .function("setRotationReference", &Editor::setRotationReference)
        .function("setAbsolutePivot", &setAbsolutePivot)
        .function("setCurveSteps", &Editor::setCurveSteps)
        .function("setDrawViewportFrame", &Editor::setDrawViewportFrame)
        .function("addPoint", &Editor::addPoint)
        .function("addLine", &Editor::addLine)
        .function("addPolygon", &Editor::addPolygon)
        .function("addCurve", &Editor::addCurve)
        .function("removeObject", &removeObject)
        .function("clearScene", &Editor::clearScene)
        .function("panWindow", &Editor::panWindow)
        .function("zoomWindow", &Editor::zoomWindow)
        .function("rotateWindow", &Editor::rotateWindow)
        .function("beginDrag", &Editor::beginDrag)
        .function("dragTo", &Editor::dragTo)
        .function("endDrag", &Editor::endDrag)
        .function("scroll", &Editor::scroll)
        .function("navigate", &navigate)
        .function("renderFrame", &Editor::renderFrame)
        .function("getFrameMeta", &getFrameMeta)
        .function("getPolylineRange", &getPolylineRange)
        .function("loadSceneString", &Editor::loadSceneString)
        .function("saveSceneString", &Editor::saveSceneString);
}
#endif
