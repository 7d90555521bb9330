#pragma once

#include "cadstring/core/types.h"
#include "cadstring/geometry/cad_string.h"
#include "cadstring/geometry/vertex_sequence.h"
#include "cadstring/history/edit_history.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

class EditSessionHost;

// Operation layer of the string editor. Owns the working vertices, the
// undo/redo history and the vertex selection for one edit session.
//
// Every operation returns an EditError and never throws. A rejected call
// leaves all state untouched; callers are free to ignore the result.
class EditEngine {
public:
    EditEngine();
    explicit EditEngine(const EditOptions& options);

    EditEngine(const EditEngine&) = delete;
    EditEngine& operator=(const EditEngine&) = delete;

    // ==============================================================================
    // Configuration
    // ==============================================================================
    void setHost(EditSessionHost* host) noexcept { host_ = host; }
    EditSessionHost* getHost() const noexcept { return host_; }
    void setOptions(const EditOptions& options);
    const EditOptions& getOptions() const noexcept { return options_; }

    // ==============================================================================
    // Session lifecycle
    // ==============================================================================
    // Starts a session on a copy of `string`. Reloading the string that is
    // already being edited only refreshes its name, type and closed flag.
    EditError loadString(const CADString& string);
    EditError save();
    EditError cancel();
    bool isSessionActive() const noexcept { return active_; }

    // ==============================================================================
    // Vertex edits
    // ==============================================================================
    EditError insertVertex(std::size_t index, InsertPlacement placement);
    EditError deleteVertex(std::size_t index);

    // Live update of the working vertices; no history entry until commitMove().
    EditError moveVertex(std::size_t index, double x, double y, double z);
    EditError commitMove();

    // Pass-throughs to the host. Not recorded in history.
    EditError reverse();
    EditError toggleOpenClosed();

    EditError undo();
    EditError redo();

    EditError selectVertex(std::optional<std::size_t> index);
    void clearSelection();

    // ==============================================================================
    // State Query
    // ==============================================================================
    const VertexSequence& getVertices() const noexcept { return working_; }
    std::size_t getVertexCount() const noexcept { return working_.size(); }
    std::optional<std::size_t> getSelectedVertex() const noexcept { return selected_; }
    bool hasPendingMove() const noexcept { return dirty_; }
    bool canUndo() const noexcept { return active_ && history_.canUndo(); }
    bool canRedo() const noexcept { return active_ && history_.canRedo(); }
    const EditHistory& getHistory() const noexcept { return history_; }

    const std::string& getStringId() const noexcept { return string_.stringId; }
    const std::string& getName() const noexcept { return string_.name; }
    StringType getStringType() const noexcept { return string_.type; }
    bool isClosed() const noexcept { return string_.isClosed; }

    // Bumped on every change a view could observe.
    std::uint32_t getGeneration() const noexcept { return generation_; }
    EditError getLastError() const noexcept { return lastError_; }

private:
    friend class EditEngineTestAccessor;

    EditError finish(EditError err, const char* op);
    void endSession();
    void clampSelection();
    Vertex computeInsertedVertex(std::size_t index, InsertPlacement placement) const;

    EditOptions options_;
    EditSessionHost* host_ = nullptr;

    // Metadata of the string being edited. Its vertex list is left empty.
    CADString string_;
    VertexSequence working_;
    EditHistory history_;
    std::optional<std::size_t> selected_;
    bool active_ = false;
    bool dirty_ = false;

    std::uint32_t generation_ = 0;
    EditError lastError_ = EditError::Ok;
};
