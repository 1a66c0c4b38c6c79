#pragma once
#include "drawing.h"
#include <optional>
#include <string>

// Access to drawing files. The nesting core talks to drawings only through
// this interface.
class DrawingStore {
public:
    virtual ~DrawingStore() = default;

    // Throws DrawingOpenError when the file is missing or unreadable.
    virtual Drawing open(const std::string& path) = 0;
    // Writes the whole drawing or nothing. Throws PersistenceError.
    virtual void save(const Drawing& drawing, const std::string& path) = 0;

    virtual std::optional<BBox> boundingBox(const Drawing& drawing,
                                            const DrawingEntity& entity) const {
        return drawing.bounds(entity);
    }
};
