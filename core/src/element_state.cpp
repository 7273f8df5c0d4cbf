#include <reel/element_state.h>

using json = nlohmann::json;

namespace reel {

namespace {

const char* axisKey(Axis axis) {
    switch (axis) {
        case Axis::X: return "x";
        case Axis::Y: return "y";
        case Axis::Z: return "z";
    }
    return "z";
}

json opToJson(const TransformOp& op) {
    if (const auto* t = std::get_if<Translate>(&op)) {
        return {{"op", "translate"}, {"x", t->x}, {"y", t->y}, {"z", t->z}};
    }
    if (const auto* r = std::get_if<Rotate>(&op)) {
        return {{"op", "rotate"}, {"axis", axisKey(r->axis)}, {"deg", r->degrees}};
    }
    if (const auto* s = std::get_if<Scale>(&op)) {
        return {{"op", "scale"}, {"x", s->x}, {"y", s->y}, {"z", s->z}};
    }
    if (const auto* k = std::get_if<Skew>(&op)) {
        return {{"op", "skew"}, {"xDeg", k->xDegrees}, {"yDeg", k->yDegrees}};
    }
    const auto& p = std::get<Perspective>(op);
    return {{"op", "perspective"}, {"distance", p.distance}};
}

} // namespace

json transformToJson(const TransformState& transform) {
    json ops = json::array();
    for (const auto& op : transform.ops()) {
        ops.push_back(opToJson(op));
    }
    const glm::vec3& o = transform.originPoint();
    return {
        {"css", transform.css()},
        {"ops", ops},
        {"origin", {o.x, o.y, o.z}}
    };
}

json cueToJson(const Cue& cue) {
    json j = {
        {"frame", cue.triggerFrame},
        {"id", cue.id},
        {"volume", cue.volume}
    };
    if (!cue.assetId.empty()) {
        j["asset"] = cue.assetId;
    }
    return j;
}

const ElementState* ElementState::child(const std::string& childId) const {
    for (const auto& c : children) {
        if (c.id == childId) return &c;
    }
    return nullptr;
}

json ElementState::toJson() const {
    json j;
    j["id"] = id;
    j["visible"] = visible;
    j["opacity"] = opacity;
    j["transform"] = transformToJson(transform);
    if (!assetId.empty()) j["asset"] = assetId;
    if (label) j["label"] = *label;
    if (value) j["value"] = *value;
    if (transition) j["transition"] = *transition;
    if (phase) j["phase"] = transitionPhaseName(*phase);
    if (!children.empty()) {
        json kids = json::array();
        for (const auto& c : children) {
            kids.push_back(c.toJson());
        }
        j["children"] = kids;
    }
    return j;
}

const ElementState* FrameState::element(const std::string& elementId) const {
    for (const auto& e : elements) {
        if (e.id == elementId) return &e;
    }
    return nullptr;
}

json FrameState::toJson() const {
    json j;
    j["frame"] = frame;
    j["fps"] = fps;
    j["activeScene"] = activeScene ? json(*activeScene) : json(nullptr);

    json list = json::array();
    for (const auto& e : elements) {
        list.push_back(e.toJson());
    }
    j["elements"] = list;

    json cueList = json::array();
    for (const auto& c : cues) {
        cueList.push_back(cueToJson(c));
    }
    j["cues"] = cueList;
    return j;
}

} // namespace reel
