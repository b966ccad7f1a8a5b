#include "vgedit/persistence/scene_codec.h"
#include "vgedit/core/logging.h"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace vgedit {

namespace {

void appendNumber(std::string& out, double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    out += buf;
}

void appendVertex(std::string& out, const Vec2& v) {
    out += "v ";
    appendNumber(out, v.x);
    out += ' ';
    appendNumber(out, v.y);
    out += " 1.0\n";
}

// Writes `l` over count fresh vertices starting at first. closed repeats the first index.
void appendIndexRun(std::string& out, std::size_t first, std::size_t count, bool closed) {
    out += 'l';
    for (std::size_t i = 0; i < count; ++i) {
        out += ' ';
        out += std::to_string(first + i);
    }
    if (closed) {
        out += ' ';
        out += std::to_string(first);
    }
    out += '\n';
}

bool parseNumber(const std::string& token, double& out) {
    if (token.empty()) return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(begin, &end);
    if (end != begin + token.size() || errno == ERANGE || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool parseIndex(const std::string& token, std::size_t vertexCount, std::size_t& out) {
    if (token.empty() || token[0] < '0' || token[0] > '9') return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(begin, &end, 10);
    if (end != begin + token.size() || errno == ERANGE) return false;
    if (value < 1 || value > vertexCount) return false;
    out = static_cast<std::size_t>(value - 1);
    return true;
}

bool parseSteps(const std::string& token, std::uint32_t& out) {
    if (token.empty() || token[0] < '0' || token[0] > '9') return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(begin, &end, 10);
    if (end != begin + token.size() || errno == ERANGE) return false;
    if (value > editor_constants::CURVE_STEPS_MAX) return false;
    out = static_cast<std::uint32_t>(value);
    return true;
}

struct Decoder {
    explicit Decoder(std::uint32_t steps) : defaultSteps(steps) {}

    std::uint32_t defaultSteps;
    std::vector<Vec2> vertices;
    std::vector<GraphicObject> objects;
    std::optional<Window> window;

    std::string currentName;
    bool pendingFilled{false};
    std::optional<curve::CurveBasis> pendingBasis;
    std::uint32_t pendingSteps{0};

    std::size_t lineNumber{0};
    std::string line;
    std::string reason;

    EngineError fail(EngineError err, std::string why) {
        reason = std::move(why);
        return err;
    }

    EngineError resolve(const std::vector<std::string>& args, std::size_t from, std::size_t to, std::vector<Vec2>& out) {
        out.clear();
        out.reserve(to - from);
        for (std::size_t i = from; i < to; ++i) {
            std::size_t index = 0;
            if (!parseIndex(args[i], vertices.size(), index)) {
                return fail(EngineError::ParseError, "bad vertex index '" + args[i] + "'");
            }
            out.push_back(vertices[index]);
        }
        return EngineError::Ok;
    }

    EngineError directive(const std::string& cmd, const std::vector<std::string>& args, const std::string& rest);
    EngineError lineDirective(const std::vector<std::string>& args);
};

EngineError Decoder::directive(const std::string& cmd, const std::vector<std::string>& args, const std::string& rest) {
    if (cmd == "v") {
        if (args.size() != 2 && args.size() != 3) return fail(EngineError::ParseError, "v expects 2 or 3 numbers");
        double x = 0.0;
        double y = 0.0;
        double w = 1.0;
        if (!parseNumber(args[0], x) || !parseNumber(args[1], y)) return fail(EngineError::ParseError, "bad number");
        if (args.size() == 3) {
            if (!parseNumber(args[2], w)) return fail(EngineError::ParseError, "bad number");
            if (w == 0.0) return fail(EngineError::ParseError, "vertex at infinity (w = 0)");
        }
        vertices.emplace_back(x / w, y / w);
        return EngineError::Ok;
    }
    if (cmd == "o") {
        currentName = rest;
        return EngineError::Ok;
    }
    if (cmd == "usemtl") {
        if (args.empty()) return fail(EngineError::ParseError, "usemtl expects a name");
        if (args[0] == "filled") {
            if (args.size() != 1) return fail(EngineError::ParseError, "usemtl filled takes no arguments");
            pendingFilled = true;
            return EngineError::Ok;
        }
        if (args[0] == "bezier") {
            pendingBasis = curve::CurveBasis::Bezier;
        } else if (args[0] == "bspline") {
            pendingBasis = curve::CurveBasis::BSpline;
        } else {
            return fail(EngineError::ParseError, "unknown material '" + args[0] + "'");
        }
        if (args.size() > 2) return fail(EngineError::ParseError, "usemtl " + args[0] + " takes at most a step count");
        pendingSteps = defaultSteps;
        if (args.size() == 2 && !parseSteps(args[1], pendingSteps)) {
            return fail(EngineError::ParseError, "bad curve step count '" + args[1] + "'");
        }
        return EngineError::Ok;
    }
    if (cmd == "p") {
        if (args.size() != 1) return fail(EngineError::ParseError, "p expects one index");
        std::vector<Vec2> pts;
        const EngineError err = resolve(args, 0, 1, pts);
        if (err != EngineError::Ok) return err;
        GraphicObject obj{};
        if (makePoint(currentName, pts[0], obj) != EngineError::Ok) {
            return fail(EngineError::ValidationError, "invalid point");
        }
        objects.push_back(std::move(obj));
        return EngineError::Ok;
    }
    if (cmd == "l") {
        return lineDirective(args);
    }
    if (cmd == "w") {
        if (args.size() != 2 && args.size() != 3) return fail(EngineError::ParseError, "w expects 2 indices and an optional angle");
        std::vector<Vec2> corners;
        const EngineError err = resolve(args, 0, 2, corners);
        if (err != EngineError::Ok) return err;
        Window next{corners[0], corners[1], 0.0};
        if (args.size() == 3 && !parseNumber(args[2], next.angleDeg)) return fail(EngineError::ParseError, "bad angle");
        if (!next.isValid()) return fail(EngineError::ValidationError, "window min must be below and left of max");
        window = next;
        return EngineError::Ok;
    }
    return fail(EngineError::ParseError, "unknown directive '" + cmd + "'");
}

EngineError Decoder::lineDirective(const std::vector<std::string>& args) {
    if (args.size() < 2) return fail(EngineError::ParseError, "l expects at least 2 indices");

    std::vector<Vec2> pts;
    GraphicObject obj{};

    if (args.size() == 2) {
        EngineError err = resolve(args, 0, 2, pts);
        if (err != EngineError::Ok) return err;
        if (makeLine(currentName, pts[0], pts[1], obj) != EngineError::Ok) {
            return fail(EngineError::ValidationError, "line endpoints coincide");
        }
    } else if (args.front() == args.back()) {
        EngineError err = resolve(args, 0, args.size() - 1, pts);
        if (err != EngineError::Ok) return err;
        if (makePolygon(currentName, pts, pendingFilled, obj) != EngineError::Ok) {
            return fail(EngineError::ValidationError, "polygon needs at least 3 vertices");
        }
        pendingFilled = false;
    } else {
        EngineError err = resolve(args, 0, args.size(), pts);
        if (err != EngineError::Ok) return err;
        const curve::CurveBasis basis = pendingBasis.value_or(curve::CurveBasis::Polyline);
        const std::uint32_t steps = pendingBasis ? pendingSteps : defaultSteps;
        if (makeCurve(currentName, basis, pts, steps, obj) != EngineError::Ok) {
            return fail(EngineError::ValidationError,
                std::string("control points or step count do not form a ") + curve::curveBasisName(basis) + " curve");
        }
        pendingBasis.reset();
    }

    objects.push_back(std::move(obj));
    return EngineError::Ok;
}

} // namespace

std::string encodeScene(const Scene& scene) {
    std::string verticesTxt;
    std::string objectsTxt;
    std::size_t idx = 1;

    if (scene.hasWindow()) {
        const Window& w = scene.window();
        appendVertex(verticesTxt, w.min);
        appendVertex(verticesTxt, w.max);
        objectsTxt += "o window\n";
        objectsTxt += "w " + std::to_string(idx) + ' ' + std::to_string(idx + 1);
        if (w.angleDeg != 0.0) {
            objectsTxt += ' ';
            appendNumber(objectsTxt, w.angleDeg);
        }
        objectsTxt += '\n';
        idx += 2;
    }

    for (std::size_t i = 0; i < scene.size(); ++i) {
        const GraphicObject& obj = *scene.objectAt(i);
        if (obj.vertices.empty()) continue;

        objectsTxt += "o " + obj.name + '\n';
        switch (obj.kind) {
            case ObjectKind::Point:
                appendVertex(verticesTxt, obj.vertices[0]);
                objectsTxt += "p " + std::to_string(idx) + '\n';
                idx += 1;
                break;
            case ObjectKind::Line:
                appendVertex(verticesTxt, obj.vertices[0]);
                appendVertex(verticesTxt, obj.vertices[1]);
                appendIndexRun(objectsTxt, idx, 2, false);
                idx += 2;
                break;
            case ObjectKind::Polygon:
                for (const Vec2& v : obj.vertices) appendVertex(verticesTxt, v);
                if (obj.filled) objectsTxt += "usemtl filled\n";
                appendIndexRun(objectsTxt, idx, obj.vertices.size(), true);
                idx += obj.vertices.size();
                break;
            case ObjectKind::Curve: {
                const bool polyline = obj.basis == curve::CurveBasis::Polyline;
                const std::vector<Vec2>& pts = polyline ? obj.vertices : obj.controlPoints;
                for (const Vec2& v : pts) appendVertex(verticesTxt, v);
                if (!polyline) {
                    objectsTxt += "usemtl ";
                    objectsTxt += curve::curveBasisName(obj.basis);
                    objectsTxt += ' ';
                    objectsTxt += std::to_string(obj.steps);
                    objectsTxt += '\n';
                }
                appendIndexRun(objectsTxt, idx, pts.size(), false);
                idx += pts.size();
                break;
            }
        }
    }

    return verticesTxt + objectsTxt;
}

EngineError decodeScene(
    const std::string& text,
    Scene& scene,
    ParseDiagnostic* diagnostic,
    std::uint32_t curveSteps
) {
    Decoder dec(curveSteps);
    std::istringstream input(text);
    std::string raw;

    while (std::getline(input, raw)) {
        ++dec.lineNumber;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();

        std::istringstream tokens(raw);
        std::string cmd;
        if (!(tokens >> cmd) || cmd[0] == '#') continue;

        std::vector<std::string> args;
        std::string token;
        while (tokens >> token) args.push_back(token);

        std::string rest;
        const std::size_t cmdEnd = raw.find(cmd) + cmd.size();
        const std::size_t restBegin = raw.find_first_not_of(" \t", cmdEnd);
        if (restBegin != std::string::npos) rest = raw.substr(restBegin);

        dec.line = raw;
        const EngineError err = dec.directive(cmd, args, rest);
        if (err != EngineError::Ok) {
            VGEDIT_LOG_WARN("scene parse failed at line %zu: %s", dec.lineNumber, dec.reason.c_str());
            if (diagnostic) {
                diagnostic->lineNumber = dec.lineNumber;
                diagnostic->line = dec.line;
                diagnostic->reason = dec.reason;
            }
            return err;
        }
    }

    Scene next = scene;
    next.clear();
    if (dec.window) {
        const EngineError err = next.setWindow(*dec.window);
        if (err != EngineError::Ok) return err;
    } else {
        next.clearWindow();
    }
    for (const GraphicObject& obj : dec.objects) {
        const EngineError err = next.addObject(obj);
        if (err != EngineError::Ok) return err;
    }

    scene = std::move(next);
    VGEDIT_LOG_DEBUG("decoded %zu objects from %zu lines", scene.size(), dec.lineNumber);
    return EngineError::Ok;
}

EngineError loadSceneFile(
    const std::string& path,
    Scene& scene,
    ParseDiagnostic* diagnostic,
    std::uint32_t curveSteps
) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        VGEDIT_LOG_WARN("cannot open '%s' for reading", path.c_str());
        if (diagnostic) *diagnostic = ParseDiagnostic{0, std::string(), "cannot open " + path};
        return EngineError::IoError;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        VGEDIT_LOG_WARN("read error on '%s'", path.c_str());
        return EngineError::IoError;
    }
    return decodeScene(contents.str(), scene, diagnostic, curveSteps);
}

EngineError saveSceneFile(const std::string& path, const Scene& scene) {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file) {
        VGEDIT_LOG_WARN("cannot open '%s' for writing", path.c_str());
        return EngineError::IoError;
    }
    const std::string contents = encodeScene(scene);
    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.flush();
    if (!file) {
        VGEDIT_LOG_WARN("write error on '%s'", path.c_str());
        return EngineError::IoError;
    }
    return EngineError::Ok;
}

} // namespace vgedit
