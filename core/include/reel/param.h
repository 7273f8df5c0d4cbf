#pragma once

/**
 * @file param.h
 * @brief Introspectable element parameters
 *
 * A Param couples a value with its name and allowed range so elements can be
 * listed, read and overridden by name (from a scene config file or a tool)
 * without knowing their concrete type.
 */

#include <string>
#include <type_traits>
#include <vector>

namespace reel {

/**
 * @brief Parameter data types
 */
enum class ParamType {
    Float,    ///< Single float value
    Int,      ///< Integer value
    Bool      ///< Boolean toggle
};

/// @brief Lower-case type name ("float", "int", "bool")
const char* paramTypeName(ParamType type);

/**
 * @brief Parameter declaration for introspection
 */
struct ParamDecl {
    std::string name;           ///< Parameter name
    ParamType type;             ///< Data type
    float minVal = 0.0f;        ///< Minimum value
    float maxVal = 1.0f;        ///< Maximum value
    float defaultVal[4] = {0, 0, 0, 0}; ///< Current value when declared
};

/**
 * @brief Type-erased access used by the element registry
 */
class ParamBase {
public:
    virtual ~ParamBase() = default;

    virtual const char* name() const = 0;
    virtual ParamDecl decl() const = 0;
    virtual void read(float out[4]) const = 0;

    /**
     * @brief Write from a float array
     * @return False if the value is outside [min, max]; the value is unchanged
     */
    virtual bool write(const float value[4]) = 0;
};

/**
 * @brief Type traits mapping C++ types to ParamType enum
 * @tparam T C++ type
 */
template<typename T> struct ParamTypeFor;
template<> struct ParamTypeFor<float> { static constexpr ParamType value = ParamType::Float; };
template<> struct ParamTypeFor<int>   { static constexpr ParamType value = ParamType::Int; };
template<> struct ParamTypeFor<bool>  { static constexpr ParamType value = ParamType::Bool; };

/**
 * @brief Scalar parameter wrapper (float, int, bool)
 * @tparam T Value type (float, int, or bool)
 *
 * Converts implicitly to T so it reads like a plain member.
 *
 * @par Example
 * @code
 * class Panel : public Element {
 * public:
 *     Param<float> radius{"radius", 130.0f, 1.0f, 2000.0f};
 *     Panel() { registerParam(radius); }
 * };
 * @endcode
 */
template<typename T>
class Param : public ParamBase {
public:
    /**
     * @brief Construct a parameter
     * @param name Parameter name, unique within an element
     * @param defaultVal Default value
     * @param minVal Minimum allowed value
     * @param maxVal Maximum allowed value
     */
    Param(const char* name, T defaultVal, T minVal = T{}, T maxVal = T{1})
        : m_name(name), m_value(defaultVal), m_min(minVal), m_max(maxVal) {}

    operator T() const { return m_value; }
    T get() const { return m_value; }

    Param& operator=(T v) {
        m_value = v;
        return *this;
    }

    const char* name() const override { return m_name; }
    T min() const { return m_min; }
    T max() const { return m_max; }

    ParamDecl decl() const override {
        return {m_name, ParamTypeFor<T>::value,
                static_cast<float>(m_min), static_cast<float>(m_max),
                {static_cast<float>(m_value)}};
    }

    void read(float out[4]) const override {
        out[0] = static_cast<float>(m_value);
        out[1] = out[2] = out[3] = 0.0f;
    }

    bool write(const float value[4]) override {
        if (!(value[0] >= static_cast<float>(m_min) && value[0] <= static_cast<float>(m_max))) {
            return false;
        }
        if constexpr (std::is_same_v<T, bool>) {
            m_value = value[0] != 0.0f;
        } else {
            m_value = static_cast<T>(value[0]);
        }
        return true;
    }

private:
    const char* m_name;
    T m_value;
    T m_min, m_max;
};

} // namespace reel
