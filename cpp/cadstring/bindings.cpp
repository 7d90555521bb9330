#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/val.h>
#endif

#include "cadstring/edit/edit_engine.h"
#include "cadstring/edit/edit_session_host.h"
#include "cadstring/geometry/cad_string.h"
#include "cadstring/interaction/coordinate_projector.h"
#include "cadstring/interaction/interaction_controller.h"
#include <optional>
#include <string>
#include <vector>

#ifdef EMSCRIPTEN
namespace {

// JS objects extending EditSessionHost / CoordinateProjector land here.
struct EditSessionHostWrapper : public emscripten::wrapper<EditSessionHost> {
    EMSCRIPTEN_WRAPPER(EditSessionHostWrapper);

    void save(VertexSequence vertices) override {
        call<void>("save", vertices.vertices());
    }
    void cancel() override { call<void>("cancel"); }
    void vertexInserted(std::size_t index, const Vertex& vertex) override {
        call<void>("vertexInserted", index, vertex);
    }
    void vertexDeleted(std::size_t index) override { call<void>("vertexDeleted", index); }
    void vertexMoved(std::size_t index, double x, double y, double z) override {
        call<void>("vertexMoved", index, x, y, z);
    }
    void reverse() override { call<void>("reverse"); }
    void open() override { call<void>("open"); }
    void close() override { call<void>("close"); }
};

struct CoordinateProjectorWrapper : public emscripten::wrapper<CoordinateProjector> {
    EMSCRIPTEN_WRAPPER(CoordinateProjectorWrapper);

    ScreenPoint worldToScreen(double x, double y, double z) const override {
        return call<ScreenPoint>("worldToScreen", x, y, z);
    }
};

// -1 stands in for "no vertex" on the JS side.
int optionalIndex(const std::optional<std::size_t>& index) {
    return index ? static_cast<int>(*index) : -1;
}

} // namespace

EMSCRIPTEN_BINDINGS(cadstring_module) {
    emscripten::value_object<Vertex>("Vertex")
        .field("x", &Vertex::x)
        .field("y", &Vertex::y)
        .field("z", &Vertex::z);

    emscripten::value_object<ScreenPoint>("ScreenPoint")
        .field("x", &ScreenPoint::x)
        .field("y", &ScreenPoint::y);

    emscripten::register_vector<Vertex>("VertexList");

    emscripten::enum_<EditError>("EditError")
        .value("Ok", EditError::Ok)
        .value("InvalidIndex", EditError::InvalidIndex)
        .value("BelowMinimumCardinality", EditError::BelowMinimumCardinality)
        .value("AtOldestState", EditError::AtOldestState)
        .value("AtNewestState", EditError::AtNewestState)
        .value("InvalidOperation", EditError::InvalidOperation);

    emscripten::enum_<InsertPlacement>("InsertPlacement")
        .value("Before", InsertPlacement::Before)
        .value("After", InsertPlacement::After);

    emscripten::enum_<Axis>("Axis")
        .value("X", Axis::X)
        .value("Y", Axis::Y)
        .value("Z", Axis::Z);

    emscripten::enum_<InteractionMode>("InteractionMode")
        .value("Viewing", InteractionMode::Viewing)
        .value("Editing", InteractionMode::Editing);

    emscripten::enum_<PointerButton>("PointerButton")
        .value("Primary", PointerButton::Primary)
        .value("Secondary", PointerButton::Secondary);

    emscripten::enum_<Key>("Key")
        .value("Other", Key::Other)
        .value("Escape", Key::Escape)
        .value("Enter", Key::Enter)
        .value("Delete", Key::Delete)
        .value("Backspace", Key::Backspace)
        .value("ArrowUp", Key::ArrowUp)
        .value("ArrowDown", Key::ArrowDown)
        .value("ArrowLeft", Key::ArrowLeft)
        .value("ArrowRight", Key::ArrowRight)
        .value("Z", Key::Z)
        .value("Y", Key::Y);

    emscripten::enum_<VertexMenuAction>("VertexMenuAction")
        .value("InsertBefore", VertexMenuAction::InsertBefore)
        .value("InsertAfter", VertexMenuAction::InsertAfter)
        .value("Delete", VertexMenuAction::Delete);

    emscripten::value_object<EditStats>("EditStats")
        .field("vertexCount", &EditStats::vertexCount)
        .field("pathLength", &EditStats::pathLength)
        .field("planLength", &EditStats::planLength)
        .field("ringLength", &EditStats::ringLength)
        .field("hasArea", &EditStats::hasArea)
        .field("planArea", &EditStats::planArea)
        .field("minGradient", &EditStats::minGradient)
        .field("maxGradient", &EditStats::maxGradient)
        .field("avgGradient", &EditStats::avgGradient)
        .field("canUndo", &EditStats::canUndo)
        .field("canRedo", &EditStats::canRedo)
        .field("historySize", &EditStats::historySize)
        .field("historyCursor", &EditStats::historyCursor);

    emscripten::value_object<VertexHandle>("VertexHandle")
        .field("index", &VertexHandle::index)
        .field("world", &VertexHandle::world)
        .field("screen", &VertexHandle::screen)
        .field("selected", &VertexHandle::selected)
        .field("first", &VertexHandle::first)
        .field("last", &VertexHandle::last)
        .field("menuOpen", &VertexHandle::menuOpen);

    emscripten::register_vector<VertexHandle>("VertexHandleList");

    emscripten::class_<EditSessionHost>("EditSessionHost")
        .allow_subclass<EditSessionHostWrapper>("EditSessionHostWrapper");

    emscripten::class_<CoordinateProjector>("CoordinateProjector")
        .allow_subclass<CoordinateProjectorWrapper>("CoordinateProjectorWrapper");

    emscripten::class_<EditEngine>("EditEngine")
        .constructor<>()
        .function("setHost", emscripten::optional_override([](EditEngine& self, EditSessionHost* host) {
            self.setHost(host);
        }), emscripten::allow_raw_pointers())
        .function("loadString", emscripten::optional_override([](EditEngine& self, const std::string& id, const std::string& name, const std::string& typeKey, bool isClosed, const std::vector<Vertex>& vertices) {
            CADString s;
            s.stringId = id;
            s.name = name;
            s.type = parseStringType(typeKey);
            s.isClosed = isClosed;
            s.vertices = VertexSequence(vertices);
            return self.loadString(s);
        }))
        .function("setHistoryLimit", emscripten::optional_override([](EditEngine& self, std::size_t limit) {
            EditOptions options = self.getOptions();
            options.historyLimit = limit;
            self.setOptions(options);
        }))
        .function("save", &EditEngine::save)
        .function("cancel", &EditEngine::cancel)
        .function("isSessionActive", emscripten::optional_override([](const EditEngine& self) { return self.isSessionActive(); }))
        .function("insertVertex", &EditEngine::insertVertex)
        .function("deleteVertex", &EditEngine::deleteVertex)
        .function("moveVertex", &EditEngine::moveVertex)
        .function("commitMove", &EditEngine::commitMove)
        .function("reverse", &EditEngine::reverse)
        .function("toggleOpenClosed", &EditEngine::toggleOpenClosed)
        .function("undo", &EditEngine::undo)
        .function("redo", &EditEngine::redo)
        .function("selectVertex", emscripten::optional_override([](EditEngine& self, int index) {
            if (index < 0) {
                self.clearSelection();
                return EditError::Ok;
            }
            return self.selectVertex(static_cast<std::size_t>(index));
        }))
        .function("getSelectedVertex", emscripten::optional_override([](const EditEngine& self) {
            return optionalIndex(self.getSelectedVertex());
        }))
        .function("getVertices", emscripten::optional_override([](const EditEngine& self) {
            return self.getVertices().vertices();
        }))
        .function("canUndo", emscripten::optional_override([](const EditEngine& self) { return self.canUndo(); }))
        .function("canRedo", emscripten::optional_override([](const EditEngine& self) { return self.canRedo(); }))
        .function("isClosed", emscripten::optional_override([](const EditEngine& self) { return self.isClosed(); }))
        .function("getStringTypeKey", emscripten::optional_override([](const EditEngine& self) {
            return std::string(stringTypeKey(self.getStringType()));
        }))
        .function("getGeneration", emscripten::optional_override([](const EditEngine& self) { return self.getGeneration(); }))
        .function("getLastError", emscripten::optional_override([](const EditEngine& self) { return self.getLastError(); }));

    emscripten::class_<InteractionController>("InteractionController")
        .constructor<EditEngine&>()
        .function("detach", &InteractionController::detach)
        .function("isAttached", emscripten::optional_override([](const InteractionController& self) { return self.isAttached(); }))
        .function("setMode", &InteractionController::setMode)
        .function("setFocused", emscripten::optional_override([](InteractionController& self, bool focused) { self.setFocused(focused); }))
        .function("setProjector", emscripten::optional_override([](InteractionController& self, CoordinateProjector* projector) {
            self.setProjector(projector);
        }), emscripten::allow_raw_pointers())
        .function("handlePointerDown", &InteractionController::handlePointerDown)
        .function("handlePointerMove", &InteractionController::handlePointerMove)
        .function("handlePointerUp", &InteractionController::handlePointerUp)
        .function("handleContextMenu", &InteractionController::handleContextMenu)
        .function("chooseMenuAction", &InteractionController::chooseMenuAction)
        .function("closeMenu", emscripten::optional_override([](InteractionController& self) { self.closeMenu(); }))
        .function("handleKeyDown", &InteractionController::handleKeyDown)
        .function("setSelectedCoordinate", &InteractionController::setSelectedCoordinate)
        .function("commitCoordinateEdit", &InteractionController::commitCoordinateEdit)
        .function("getVertexHandles", &InteractionController::getVertexHandles)
        .function("pickVertex", emscripten::optional_override([](const InteractionController& self, float x, float y) {
            return optionalIndex(self.pickVertex(x, y));
        }))
        .function("getStats", emscripten::optional_override([](const InteractionController& self) {
            return self.getStats();
        }));
}
#endif
