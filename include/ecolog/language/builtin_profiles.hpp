#pragma once

#include <vector>

#include "ecolog/language/language_profile.hpp"

namespace ecolog::language {

auto MakeJavaScriptProfile() -> LanguageProfile;
auto MakeTypeScriptProfile() -> LanguageProfile;
auto MakeTsxProfile() -> LanguageProfile;
auto MakePythonProfile() -> LanguageProfile;
auto MakeGoProfile() -> LanguageProfile;
auto MakeRustProfile() -> LanguageProfile;
auto MakeRubyProfile() -> LanguageProfile;
auto MakePhpProfile() -> LanguageProfile;
auto MakeJavaProfile() -> LanguageProfile;
auto MakeCSharpProfile() -> LanguageProfile;
auto MakeCProfile() -> LanguageProfile;
auto MakeCppProfile() -> LanguageProfile;
auto MakeBashProfile() -> LanguageProfile;
auto MakeLuaProfile() -> LanguageProfile;

auto BuiltinProfiles() -> std::vector<LanguageProfile>;

}  // namespace ecolog::language
