#ifndef SCHEMER_PREFERENCE_STORE_HPP
#define SCHEMER_PREFERENCE_STORE_HPP

#include <string>

#include "schemer/PackedColor.hpp"

// Live key/value preference store of the host editor.
// Every setter must be safe to repeat with the same arguments: a caller may
// rerun a whole import after a transient failure in the host.
class PreferenceStore {
public:
    virtual ~PreferenceStore() = default;

    virtual void SetBooleanPreference(const std::string& name, bool value) = 0;
    virtual void SetIntegerPreference(const std::string& name, int value) = 0;

    // Current value of a color; unknown names read as the store's default.
    virtual Rgb GetColorPreference(const std::string& name) const = 0;
    virtual void SetColorPreference(const std::string& name, const Rgb& color) = 0;

    // Tells widgets watching name that its color changed.
    virtual void NotifyColorListeners(const std::string& name) = 0;
};

#endif // SCHEMER_PREFERENCE_STORE_HPP
