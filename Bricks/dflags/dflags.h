/*******************************************************************************
The MIT License (MIT)

Copyright (c) 2026 The Weblog Authors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*******************************************************************************/

// `dflags` is a header-only command line flags parser.
//
// Usage:
//
//   DEFINE_string(log, "demo.log", "The log file to analyze.");
//   DEFINE_bool(verbose, false, "Set to log to stderr.");
//
//   int main(int argc, char** argv) {
//     ParseDFlags(&argc, &argv);
//     ...
//   }
//
// Both `-flag` and `--flag` are accepted, with the value as the next parameter or after the '=' sign.
// Boolean flags may omit the value, which is then `true`. `--help` lists all registered flags.
// Arguments that are not flags are kept in `argv`, in their original order, after `argv[0]`.

#ifndef BRICKS_DFLAGS_DFLAGS_H
#define BRICKS_DFLAGS_DFLAGS_H

#include "../../port.h"

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include "../strings/util.h"
#include "../util/singleton.h"

namespace weblog {
namespace dflags {

class FlagBase {
 public:
  FlagBase(const std::string& name, const std::string& description) : name_(name), description_(description) {}
  virtual ~FlagBase() = default;

  const std::string& Name() const { return name_; }
  const std::string& Description() const { return description_; }

  virtual std::string TypeAsString() const = 0;
  virtual std::string DefaultValueAsString() const = 0;
  virtual bool IsBool() const = 0;
  virtual bool SetValueFromString(const std::string& value) = 0;

 private:
  const std::string name_;
  const std::string description_;
};

template <typename T>
struct FlagTraits;

template <>
struct FlagTraits<bool> {
  static std::string TypeAsString() { return "bool"; }
  static std::string DefaultValueAsString(bool value) { return value ? "True" : "False"; }
  static bool Parse(const std::string& s, bool& output) { return strings::TryFromString(s, output); }
};

template <>
struct FlagTraits<std::string> {
  static std::string TypeAsString() { return "std::string"; }
  static std::string DefaultValueAsString(const std::string& value) { return '\'' + value + '\''; }
  static bool Parse(const std::string& s, std::string& output) {
    output = s;
    return true;
  }
};

#define WEBLOG_DFLAGS_NUMERIC_TRAITS(type)                                                 \
  template <>                                                                              \
  struct FlagTraits<type> {                                                                \
    static std::string TypeAsString() { return #type; }                                    \
    static std::string DefaultValueAsString(type value) { return strings::ToString(value); } \
    static bool Parse(const std::string& s, type& output) { return strings::TryFromString(s, output); } \
  }

WEBLOG_DFLAGS_NUMERIC_TRAITS(uint32_t);
WEBLOG_DFLAGS_NUMERIC_TRAITS(uint64_t);

#undef WEBLOG_DFLAGS_NUMERIC_TRAITS

template <typename T>
class Flag final : public FlagBase {
 public:
  Flag(const std::string& name, const std::string& description, T& ref, const T& default_value)
      : FlagBase(name, description), ref_(ref), default_value_(default_value) {}

  std::string TypeAsString() const override { return FlagTraits<T>::TypeAsString(); }
  std::string DefaultValueAsString() const override { return FlagTraits<T>::DefaultValueAsString(default_value_); }
  bool IsBool() const override { return std::is_same<T, bool>::value; }
  bool SetValueFromString(const std::string& value) override { return FlagTraits<T>::Parse(value, ref_); }

 private:
  T& ref_;
  const T default_value_;
};

class FlagsManager {
 public:
  struct FlagsRegistererInterface {
    virtual ~FlagsRegistererInterface() = default;
    virtual void RegisterFlag(FlagBase* flag) = 0;
    virtual void ParseFlags(int& argc, char**& argv) = 0;
  };

  class DefaultRegisterer : public FlagsRegistererInterface {
   public:
    virtual ~DefaultRegisterer() = default;

    void RegisterFlag(FlagBase* flag) override { flags_[flag->Name()] = flag; }

    void ParseFlags(int& argc, char**& argv) override {
      if (parse_flags_called_) {
        Fail("ParseDFlags() is called more than once.");
      }
      parse_flags_called_ = true;

      args_.clear();
      args_.push_back(argv[0]);
      for (int i = 1; i < argc; ++i) {
        const char* const arg = argv[i];
        if (arg[0] != '-') {
          args_.push_back(argv[i]);
          continue;
        }
        size_t dashes = 0;
        while (arg[dashes] == '-') {
          ++dashes;
        }
        if (dashes > 2) {
          Fail("Parameter: '" + std::string(arg) + "' has too many dashes in front.");
        }
        std::string name(arg + dashes);
        std::string value;
        bool has_value = false;
        const size_t eq = name.find('=');
        if (eq != std::string::npos) {
          value = name.substr(eq + 1);
          name = name.substr(0, eq);
          has_value = true;
        }
        if (name == "help") {
          PrintHelpAndExit();
        }
        const auto cit = flags_.find(name);
        if (cit == flags_.end()) {
          Fail("Undefined flag: '" + name + "'.");
        }
        FlagBase* flag = cit->second;
        if (!has_value) {
          if (flag->IsBool()) {
            bool unused;
            if (i + 1 < argc && strings::TryFromString(std::string(argv[i + 1]), unused)) {
              value = argv[++i];
            } else {
              value = "true";
            }
          } else if (i + 1 < argc) {
            value = argv[++i];
          } else {
            Fail("Flag: '" + name + "' is not provided with the value.");
          }
        }
        if (!flag->SetValueFromString(value)) {
          Fail("Can not parse '" + value + "' for flag '" + name + "'.");
        }
      }
      args_.push_back(nullptr);
      argc = static_cast<int>(args_.size() - 1);
      argv = args_.data();
    }

    virtual std::ostream& HelpPrinterOStream() const { return std::cout; }
    virtual int HelpPrinterReturnCode() const { return 0; }

   private:
    void PrintHelpAndExit() const {
      std::ostream& os = HelpPrinterOStream();
      os << flags_.size() << " flags registered.\n";
      for (const auto& cit : flags_) {
        os << "\t--" << cit.first << " , " << cit.second->TypeAsString() << '\n';
        os << "\t\t" << cit.second->Description() << '\n';
        os << "\t\tDefault value: " << cit.second->DefaultValueAsString() << '\n';
      }
      os.flush();
      std::exit(HelpPrinterReturnCode());
    }

    static void Fail(const std::string& message) {
      std::cerr << message << std::endl;
      std::exit(-1);
    }

    std::map<std::string, FlagBase*> flags_;
    std::vector<char*> args_;
    bool parse_flags_called_ = false;
  };

  class ScopedSingletonInjector final {
   public:
    explicit ScopedSingletonInjector(FlagsRegistererInterface& injected) : previous_(ActiveRegisterer()) {
      ActiveRegisterer() = &injected;
    }
    ScopedSingletonInjector(ScopedSingletonInjector&& rhs) : previous_(rhs.previous_) { rhs.previous_ = nullptr; }
    ~ScopedSingletonInjector() {
      if (previous_) {
        ActiveRegisterer() = previous_;
      }
    }

   private:
    FlagsRegistererInterface* previous_;

    ScopedSingletonInjector(const ScopedSingletonInjector&) = delete;
    void operator=(const ScopedSingletonInjector&) = delete;
  };

  static FlagsRegistererInterface& Registerer() { return *ActiveRegisterer(); }

 private:
  static FlagsRegistererInterface*& ActiveRegisterer() {
    static FlagsRegistererInterface* active = &Singleton<DefaultRegisterer>();
    return active;
  }
};

template <typename T>
struct FlagRegisterer final {
  FlagRegisterer(T& ref, const char* name, const T& default_value, const char* description)
      : flag(name, description, ref, default_value) {
    FlagsManager::Registerer().RegisterFlag(&flag);
  }
  Flag<T> flag;
};

}  // namespace weblog::dflags
}  // namespace weblog

#define WEBLOG_DEFINE_FLAG(type, name, default_value, description) \
  type FLAGS_##name = default_value;                               \
  ::weblog::dflags::FlagRegisterer<type> dflags_registerer_##name(FLAGS_##name, #name, default_value, description)

#define DEFINE_bool(name, default_value, description) WEBLOG_DEFINE_FLAG(bool, name, default_value, description)
#define DEFINE_string(name, default_value, description) \
  WEBLOG_DEFINE_FLAG(std::string, name, default_value, description)
#define DEFINE_uint32(name, default_value, description) WEBLOG_DEFINE_FLAG(uint32_t, name, default_value, description)
#define DEFINE_uint64(name, default_value, description) WEBLOG_DEFINE_FLAG(uint64_t, name, default_value, description)

inline void ParseDFlags(int* argc, char*** argv) {
  ::weblog::dflags::FlagsManager::Registerer().ParseFlags(*argc, *argv);
}

#endif  // BRICKS_DFLAGS_DFLAGS_H
