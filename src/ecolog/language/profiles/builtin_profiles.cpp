#include "ecolog/language/builtin_profiles.hpp"

namespace ecolog::language {

auto BuiltinProfiles() -> std::vector<LanguageProfile> {
  std::vector<LanguageProfile> profiles;
  profiles.reserve(14);
  profiles.push_back(MakeJavaScriptProfile());
  profiles.push_back(MakeTypeScriptProfile());
  profiles.push_back(MakeTsxProfile());
  profiles.push_back(MakePythonProfile());
  profiles.push_back(MakeGoProfile());
  profiles.push_back(MakeRustProfile());
  profiles.push_back(MakeRubyProfile());
  profiles.push_back(MakePhpProfile());
  profiles.push_back(MakeJavaProfile());
  profiles.push_back(MakeCSharpProfile());
  profiles.push_back(MakeCProfile());
  profiles.push_back(MakeCppProfile());
  profiles.push_back(MakeBashProfile());
  profiles.push_back(MakeLuaProfile());
  return profiles;
}

}  // namespace ecolog::language
