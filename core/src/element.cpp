#include <reel/element.h>
#include <iostream>

namespace reel {

const char* paramTypeName(ParamType type) {
    switch (type) {
        case ParamType::Float: return "float";
        case ParamType::Int:   return "int";
        case ParamType::Bool:  return "bool";
    }
    return "float";
}

std::vector<ParamDecl> Element::params() const {
    std::vector<ParamDecl> decls;
    decls.reserve(m_params.size());
    for (const auto* p : m_params) {
        decls.push_back(p->decl());
    }
    return decls;
}

ParamBase* Element::findParam(const std::string& name) const {
    for (auto* p : m_params) {
        if (name == p->name()) return p;
    }
    return nullptr;
}

bool Element::getParam(const std::string& name, float out[4]) const {
    const ParamBase* p = findParam(name);
    if (!p) return false;
    p->read(out);
    return true;
}

bool Element::setParam(const std::string& name, const float value[4]) {
    ParamBase* p = findParam(name);
    if (!p) return false;
    if (!p->write(value)) {
        ParamDecl d = p->decl();
        std::cerr << "[" << this->name() << "] Rejected " << name << " = " << value[0]
                  << " (range " << d.minVal << " to " << d.maxVal << ")\n";
        return false;
    }
    return true;
}

} // namespace reel
