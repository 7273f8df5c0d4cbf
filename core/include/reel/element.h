#pragma once

/**
 * @file element.h
 * @brief Base class for animated elements
 *
 * An Element turns a local frame into an ElementState tree. Elements keep no
 * per-frame state: evaluate() is const and may be called for any frame in
 * any order.
 */

#include <reel/context.h>
#include <reel/cue.h>
#include <reel/element_state.h>
#include <reel/param.h>
#include <string>
#include <vector>

namespace reel {

/**
 * @brief Base class for all animated elements
 *
 * Subclasses declare Param members, register them in their constructor and
 * implement evaluate(). validate() is called once by Composition::init()
 * after parameters have been set and before any frame is rendered.
 *
 * @par Example
 * @code
 * class Fade : public Element {
 * public:
 *     Param<int> length{"length", 30, 1, 600};
 *     Fade() { registerParam(length); }
 *     std::string name() const override { return "Fade"; }
 *     ElementState evaluate(const Context& ctx) const override {
 *         ElementState s;
 *         s.opacity = interpolate(ctx.frame(), {0, float(length)}, {0, 1}, Extrapolation::clamped());
 *         return s;
 *     }
 * };
 * @endcode
 */
class Element {
public:
    Element() = default;
    virtual ~Element() = default;

    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    /// @brief Type name for logs ("Wheel", "BarGraph")
    virtual std::string name() const = 0;

    /**
     * @brief Build derived configuration and check parameters
     * @throw ConfigurationError if the element cannot be scheduled
     */
    virtual void validate() {}

    /**
     * @brief State at a local frame
     *
     * Only called while the element is mounted; ctx.frame() is relative to
     * the element's window.
     */
    virtual ElementState evaluate(const Context& ctx) const = 0;

    /// @brief Cues in local frames
    virtual CueSheet cues() const { return {}; }

    // -------------------------------------------------------------------------
    /// @name Parameter Introspection
    /// @{

    /// @brief Declarations of every registered parameter
    std::vector<ParamDecl> params() const;

    /**
     * @brief Read a parameter
     * @return False if no parameter has that name
     */
    bool getParam(const std::string& name, float out[4]) const;

    /**
     * @brief Write a parameter
     * @return False if no parameter has that name or the value is out of range
     */
    bool setParam(const std::string& name, const float value[4]);

    /// @}

protected:
    void registerParam(ParamBase& param) { m_params.push_back(&param); }

private:
    ParamBase* findParam(const std::string& name) const;

    std::vector<ParamBase*> m_params;
};

} // namespace reel
