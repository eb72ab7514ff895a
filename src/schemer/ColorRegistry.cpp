#include "schemer/ColorRegistry.hpp"

#include <stdexcept>
#include <utility>

namespace {
const char* const kTextColor = "ColorsText";
const char* const kBackgroundColor = "ColorsBackground";

ColorEntry Entry(const std::string& name, const FallbackSpec& fallback) {
    return ColorEntry{name, fallback, false};
}

ColorEntry Ref(const std::string& name, const std::string& source) {
    return Entry(name, FallbackSpec::Reference(source));
}
}

FallbackSpec FallbackSpec::None() {
    return FallbackSpec{Kind::None, {}, 1.0, 0};
}

FallbackSpec FallbackSpec::Reference(const std::string& name) {
    return FallbackSpec{Kind::Reference, {name}, 1.0, 0};
}

FallbackSpec FallbackSpec::Average(const std::vector<std::string>& names) {
    return FallbackSpec{Kind::Average, names, 1.0, 0};
}

FallbackSpec FallbackSpec::Scaled(const std::string& name, double factor) {
    return FallbackSpec{Kind::Scaled, {name}, factor, 0};
}

FallbackSpec FallbackSpec::Literal(int32_t packed) {
    return FallbackSpec{Kind::Literal, {}, 1.0, packed};
}

ColorRegistry::ColorRegistry(std::vector<ColorEntry> entries)
    : entries_(std::move(entries)) {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (!index_.emplace(entries_[i].name, i).second) {
            throw std::invalid_argument("Color registered twice: " + entries_[i].name);
        }
    }
    if (!Contains(kTextColor) || !Contains(kBackgroundColor)) {
        throw std::invalid_argument("Color registry must declare ColorsText and ColorsBackground");
    }
}

ColorRegistry ColorRegistry::Default() {
    std::vector<ColorEntry> entries{
        // Desktop colors: the two the scheme file must supply.
        Entry(kTextColor, FallbackSpec::None()),
        Entry(kBackgroundColor, FallbackSpec::None()),
        // MATLAB syntax and command window.
        Entry("Colors_M_Errors", FallbackSpec::Literal(-65536)),
        Entry("Colors_M_Warnings", FallbackSpec::Literal(-27648)),
        Ref("Colors_M_Keywords", kTextColor),
        Entry("Colors_M_Comments", FallbackSpec::Average({kTextColor, kBackgroundColor})),
        Ref("Colors_M_Strings", kTextColor),
        Ref("Colors_M_UnterminatedStrings", "Colors_M_Errors"),
        Ref("Colors_M_SystemCommands", "Colors_M_Keywords"),
        Ref("Colors_HTML_HTMLLinks", kTextColor),
        Ref("Color_CmdWinWarnings", "Colors_M_Warnings"),
        Ref("Color_CmdWinErrors", "Colors_M_Errors"),
        // Programming tools and editor display.
        Ref("ColorsMLintAutoFixBackground", kBackgroundColor),
        Ref("Editor.VariableHighlighting.Color", kBackgroundColor),
        Ref("Editor.NonlocalVariableHighlighting.TextColor", kTextColor),
        Ref("Editorhighlight-lines", kBackgroundColor),
        Ref("Editorhighlight-caret-row-boolean-color", kBackgroundColor),
        Ref("EditorRightTextLimitLineColor", kTextColor),
        // MuPAD
        Ref("Editor.Language.MuPAD.Color.keyword", "Colors_M_Keywords"),
        Ref("Editor.Language.MuPAD.Color.operator", "Colors_M_SystemCommands"),
        Ref("Editor.Language.MuPAD.Color.block-comment", "Colors_M_Comments"),
        Ref("Editor.Language.MuPAD.Color.option", "Colors_M_UnterminatedStrings"),
        Ref("Editor.Language.MuPAD.Color.string", "Colors_M_Strings"),
        Entry("Editor.Language.MuPAD.Color.function", FallbackSpec::Average({"Colors_M_Keywords", kBackgroundColor})),
        Ref("Editor.Language.MuPAD.Color.constant", "Editor.NonlocalVariableHighlighting.TextColor"),
        // TLC
        Ref("Editor.Language.TLC.Color.Colors_M_SystemCommands", "Colors_M_Keywords"),
        Ref("Editor.Language.TLC.Color.Colors_M_Keywords", "Colors_M_SystemCommands"),
        Ref("Editor.Language.TLC.Color.Colors_M_Comments", "Colors_M_Comments"),
        Ref("Editor.Language.TLC.Color.string-literal", "Colors_M_Strings"),
        // VRML
        Ref("Editor.Language.VRML.Color.keyword", "Colors_M_Keywords"),
        Ref("Editor.Language.VRML.Color.node-keyword", "Colors_HTML_HTMLLinks"),
        Ref("Editor.Language.VRML.Color.field-keyword", "Editor.NonlocalVariableHighlighting.TextColor"),
        Ref("Editor.Language.VRML.Color.data-type-keyword", "Colors_M_UnterminatedStrings"),
        Ref("Editor.Language.VRML.Color.terminal-symbol", "Colors_M_SystemCommands"),
        Ref("Editor.Language.VRML.Color.comment", "Colors_M_Comments"),
        Ref("Editor.Language.VRML.Color.string", "Colors_M_Strings"),
        // C/C++
        Ref("Editor.Language.C.Color.keywords", "Colors_M_Keywords"),
        Ref("Editor.Language.C.Color.line-comment", "Colors_M_Comments"),
        Ref("Editor.Language.C.Color.string-literal", "Colors_M_Strings"),
        Ref("Editor.Language.C.Color.preprocessor", "Colors_M_SystemCommands"),
        Ref("Editor.Language.C.Color.char-literal", "Colors_M_UnterminatedStrings"),
        Ref("Editor.Language.C.Color.errors", "Colors_M_Errors"),
        // Java
        Ref("Editor.Language.Java.Color.keywords", "Colors_M_Keywords"),
        Ref("Editor.Language.Java.Color.line-comment", "Colors_M_Comments"),
        Ref("Editor.Language.Java.Color.string-literal", "Colors_M_Strings"),
        Ref("Editor.Language.Java.Color.char-literal", "Colors_M_UnterminatedStrings"),
        // VHDL
        Ref("Editor.Language.VHDL.Color.Colors_M_Keywords", "Colors_M_Keywords"),
        Ref("Editor.Language.VHDL.Color.operator", "Colors_M_SystemCommands"),
        Ref("Editor.Language.VHDL.Color.Colors_M_Comments", "Colors_M_Comments"),
        Ref("Editor.Language.VHDL.Color.string-literal", "Colors_M_Strings"),
        // Verilog
        Ref("Editor.Language.Verilog.Color.Colors_M_Keywords", "Colors_M_Keywords"),
        Ref("Editor.Language.Verilog.Color.operator", "Colors_M_SystemCommands"),
        Ref("Editor.Language.Verilog.Color.Colors_M_Comments", "Colors_M_Comments"),
        Ref("Editor.Language.Verilog.Color.string-literal", "Colors_M_Strings"),
        // XML
        Ref("Editor.Language.XML.Color.error", "Colors_M_Errors"),
        Ref("Editor.Language.XML.Color.tag", "Colors_M_Keywords"),
        Ref("Editor.Language.XML.Color.attribute", "Colors_M_UnterminatedStrings"),
        Ref("Editor.Language.XML.Color.operator", "Colors_M_SystemCommands"),
        Ref("Editor.Language.XML.Color.value", "Colors_M_Strings"),
        Ref("Editor.Language.XML.Color.comment", "Colors_M_Comments"),
        Ref("Editor.Language.XML.Color.doctype", "Colors_HTML_HTMLLinks"),
        Ref("Editor.Language.XML.Color.ref", "Colors_M_UnterminatedStrings"),
        Ref("Editor.Language.XML.Color.pi-content", "Colors_HTML_HTMLLinks"),
        Ref("Editor.Language.XML.Color.cdata-section", "Editor.NonlocalVariableHighlighting.TextColor"),
    };
    return ColorRegistry(std::move(entries));
}

bool ColorRegistry::Contains(const std::string& name) const {
    return index_.find(name) != index_.end();
}

void ColorRegistry::ResetSetFlags() {
    for (ColorEntry& entry : entries_) {
        entry.is_set = false;
    }
}

bool ColorRegistry::MarkSet(const std::string& name) {
    std::unordered_map<std::string, std::size_t>::const_iterator it = index_.find(name);
    if (it == index_.cend()) {
        return false;
    }
    entries_[it->second].is_set = true;
    return true;
}

bool ColorRegistry::IsSet(const std::string& name) const {
    std::unordered_map<std::string, std::size_t>::const_iterator it = index_.find(name);
    if (it == index_.cend()) {
        return false;
    }
    return entries_[it->second].is_set;
}

std::size_t ColorRegistry::SetCount() const {
    std::size_t count = 0;
    for (const ColorEntry& entry : entries_) {
        if (entry.is_set) {
            ++count;
        }
    }
    return count;
}

PreferenceTables::PreferenceTables(const std::vector<std::string>& booleans,
                                   const std::vector<std::string>& integers,
                                   ColorRegistry colors)
    : booleans_(booleans.begin(), booleans.end()),
      integers_(integers.begin(), integers.end()),
      colors_(std::move(colors)) {
    for (const std::string& name : booleans_) {
        if (integers_.count(name) != 0 || colors_.Contains(name)) {
            throw std::invalid_argument("Preference in more than one category: " + name);
        }
    }
    for (const std::string& name : integers_) {
        if (colors_.Contains(name)) {
            throw std::invalid_argument("Preference in more than one category: " + name);
        }
    }
}

PreferenceTables PreferenceTables::Default() {
    const std::vector<std::string> booleans{
        "ColorsUseSystem",
        "ColorsUseMLintAutoFixBackground",
        "Editor.VariableHighlighting.Automatic",
        "Editor.NonlocalVariableHighlighting",
        "EditorCodepadHighVisible",
        "EditorCodeBlockDividers",
        "Editorhighlight-caret-row-boolean",
        "EditorRightTextLineVisible"
    };
    const std::vector<std::string> integers{
        "EditorRightTextLimitLineWidth"
    };
    return PreferenceTables(booleans, integers, ColorRegistry::Default());
}

bool PreferenceTables::Classify(const std::string& name, bool include_booleans, PreferenceCategory& category) const {
    if (include_booleans && booleans_.count(name) != 0) {
        category = PreferenceCategory::Boolean;
        return true;
    }
    if (integers_.count(name) != 0) {
        category = PreferenceCategory::Integer;
        return true;
    }
    if (colors_.Contains(name)) {
        category = PreferenceCategory::Color;
        return true;
    }
    return false;
}
