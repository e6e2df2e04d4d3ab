#include "language.h"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <regex>
#include <sstream>
#include "error.h"
#include "util.h"

namespace runbox {

namespace {

String JoinQuoted(const Vector<SourceFile>& files,
                  const Vector<const char*>& suffixes) {
  String joined;
  for (const SourceFile& file : files) {
    for (const char* suffix : suffixes) {
      if (boost::algorithm::ends_with(file.name, suffix)) {
        joined += ' ';
        joined += ShellQuote(file.name);
        break;
      }
    }
  }
  return joined;
}

String ChangeDir(const Path& scratch_dir) {
  return "cd " + ShellQuote(scratch_dir.string()) + " && ";
}

class Python : public LanguageStrategy {
 public:
  Language language() const override { return Language::kPython; }
  const char* name() const override { return "python"; }

  String BuildCommand(const Vector<SourceFile>& files,
                      StringView entry_file,
                      const Path& scratch_dir) const override {
    // Imports resolve only inside the scratch directory and its installed
    // packages.
    String search_path = scratch_dir.string() + ":" +
                         (scratch_dir / dependency_dir()).string();
    return ChangeDir(scratch_dir) + "PYTHONPATH=" + ShellQuote(search_path) +
           " PYTHONNOUSERSITE=1 python3 -u " + ShellQuote(entry_file);
  }

  String DefaultFileName(StringView code) const override { return "main.py"; }

  const char* manifest_file() const override { return "requirements.txt"; }
  const char* dependency_dir() const override { return ".deps"; }

  String InstallCommand(const Path& scratch_dir) const override {
    return ChangeDir(scratch_dir) +
           "python3 -m pip install --no-cache-dir --disable-pip-version-check"
           " --target .deps -r requirements.txt 2>&1";
  }

  String RenderManifest(
      const OrderedMap<String, String>& dependencies) const override {
    String manifest;
    for (const auto& dependency : dependencies) {
      manifest += dependency.first;
      if (!dependency.second.empty() && dependency.second != "*") {
        manifest += "==" + dependency.second;
      }
      manifest += '\n';
    }
    return manifest;
  }
};

class JavaScript : public LanguageStrategy {
 public:
  Language language() const override { return Language::kJavaScript; }
  const char* name() const override { return "javascript"; }

  String BuildCommand(const Vector<SourceFile>& files,
                      StringView entry_file,
                      const Path& scratch_dir) const override {
    return ChangeDir(scratch_dir) + "NODE_PATH=" +
           ShellQuote((scratch_dir / dependency_dir()).string()) + " node " +
           ShellQuote(entry_file);
  }

  String DefaultFileName(StringView code) const override { return "main.js"; }

  const char* manifest_file() const override { return "package.json"; }
  const char* dependency_dir() const override { return "node_modules"; }

  String InstallCommand(const Path& scratch_dir) const override {
    return ChangeDir(scratch_dir) +
           "npm install --no-audit --no-fund --legacy-peer-deps 2>&1";
  }

  String RenderManifest(
      const OrderedMap<String, String>& dependencies) const override {
    boost::property_tree::ptree package;
    package.put("name", "runbox-project");
    package.put("version", "1.0.0");
    boost::property_tree::ptree versions;
    for (const auto& dependency : dependencies) {
      // Keys may contain '.', so bypass put() path parsing.
      versions.push_back(std::make_pair(
          dependency.first,
          boost::property_tree::ptree(
              dependency.second.empty() ? "*" : dependency.second)));
    }
    package.add_child("dependencies", versions);
    std::ostringstream stream;
    boost::property_tree::write_json(stream, package);
    return stream.str();
  }
};

class Java : public LanguageStrategy {
 public:
  Language language() const override { return Language::kJava; }
  const char* name() const override { return "java"; }

  String BuildCommand(const Vector<SourceFile>& files,
                      StringView entry_file,
                      const Path& scratch_dir) const override {
    const SourceFile* entry = FindFile(files, entry_file);
    String main_class = FindJavaMainClass(entry ? entry->content : "");
    // The JVM reserves large address ranges up front; keep them inside the
    // sandbox address space limit.
    static const char kJvmOptions[] =
        " -Xmx256m -Xss8m -XX:+UseSerialGC -XX:CompressedClassSpaceSize=64m"
        " -XX:ReservedCodeCacheSize=64m -XX:MaxMetaspaceSize=128m";
    static const char kJavacOptions[] =
        " -J-Xmx256m -J-XX:+UseSerialGC -J-XX:CompressedClassSpaceSize=64m"
        " -J-XX:ReservedCodeCacheSize=64m";
    return ChangeDir(scratch_dir) + "javac" + kJavacOptions +
           " -cp '.:lib/*' -d ." + JoinQuoted(files, {".java"}) + " && java" +
           kJvmOptions + " -cp '.:lib/*' " + ShellQuote(main_class);
  }

  String DefaultFileName(StringView code) const override {
    String main_class = FindJavaMainClass(code);
    size_t dot = main_class.rfind('.');
    if (dot != String::npos) {
      main_class = main_class.substr(dot + 1);
    }
    return main_class + ".java";
  }

  const char* manifest_file() const override { return "pom.xml"; }
  const char* dependency_dir() const override { return "lib"; }

  String InstallCommand(const Path& scratch_dir) const override {
    return ChangeDir(scratch_dir) +
           "mvn -q -B dependency:copy-dependencies -DoutputDirectory=lib 2>&1";
  }

  // Dependency names are "groupId:artifactId".
  String RenderManifest(
      const OrderedMap<String, String>& dependencies) const override {
    namespace pt = boost::property_tree;
    pt::ptree project;
    project.put("<xmlattr>.xmlns", "http://maven.apache.org/POM/4.0.0");
    project.put("modelVersion", "4.0.0");
    project.put("groupId", "runbox");
    project.put("artifactId", "project");
    project.put("version", "1.0.0");
    pt::ptree& list = project.put_child("dependencies", pt::ptree());
    for (const auto& dependency : dependencies) {
      size_t colon = dependency.first.find(':');
      if (colon == String::npos) {
        LOG(WARNING) << "Ignoring Maven dependency without group: "
                     << dependency.first;
        continue;
      }
      pt::ptree entry;
      entry.put("groupId", dependency.first.substr(0, colon));
      entry.put("artifactId", dependency.first.substr(colon + 1));
      entry.put("version", dependency.second);
      list.push_back(std::make_pair("dependency", entry));
    }
    pt::ptree pom;
    pom.add_child("project", project);
    std::ostringstream stream;
    pt::write_xml(stream, pom, pt::xml_writer_make_settings<String>(' ', 2));
    return stream.str();
  }
};

class Cpp : public LanguageStrategy {
 public:
  Language language() const override { return Language::kCpp; }
  const char* name() const override { return "cpp"; }

  String BuildCommand(const Vector<SourceFile>& files,
                      StringView entry_file,
                      const Path& scratch_dir) const override {
    return ChangeDir(scratch_dir) + "g++ -std=c++20 -I. -Iinclude" +
           JoinQuoted(files, {".cpp", ".cc", ".cxx"}) +
           " -o a.out && ./a.out";
  }

  String DefaultFileName(StringView code) const override { return "main.cpp"; }
};

}  // namespace

Optional<Language> ParseLanguage(StringView name) {
  static const HashMap<String, Language> kNames = {
      {"python", Language::kPython},
      {"python3", Language::kPython},
      {"py", Language::kPython},
      {"javascript", Language::kJavaScript},
      {"js", Language::kJavaScript},
      {"node", Language::kJavaScript},
      {"java", Language::kJava},
      {"cpp", Language::kCpp},
      {"c++", Language::kCpp},
      {"cxx", Language::kCpp},
  };
  auto iter = kNames.find(name.to_string());
  if (iter == kNames.end()) {
    return boost::none;
  }
  return iter->second;
}

const LanguageStrategy& GetLanguage(Language language) {
  static const Python python{};
  static const JavaScript javascript{};
  static const Java java{};
  static const Cpp cpp{};
  switch (language) {
    case Language::kPython:
      return python;
    case Language::kJavaScript:
      return javascript;
    case Language::kJava:
      return java;
    case Language::kCpp:
      return cpp;
  }
  LOG(FATAL) << "unknown language " << static_cast<int>(language);
  return python;
}

String SynthesizeCommand(StringView language,
                         const Vector<SourceFile>& files,
                         StringView entry_file,
                         const Path& scratch_dir,
                         ErrorCode& ec) {
  Optional<Language> parsed = ParseLanguage(language);
  if (!parsed) {
    ec = Errc::kUnsupportedLanguage;
    return String();
  }
  ec.clear();
  return GetLanguage(*parsed).BuildCommand(files, entry_file, scratch_dir);
}

Optional<Manifest> ResolveManifest(const SourceBundle& bundle) {
  const LanguageStrategy& strategy = GetLanguage(bundle.language);
  StringView file_name = strategy.manifest_file();
  if (file_name.empty()) {
    return boost::none;
  }
  Manifest manifest;
  manifest.file_name = file_name.to_string();
  if (const SourceFile* file = FindFile(bundle.files, file_name)) {
    manifest.content = file->content;
    return manifest;
  }
  if (bundle.dependencies.empty()) {
    return boost::none;
  }
  manifest.content = strategy.RenderManifest(bundle.dependencies);
  manifest.generated = true;
  return manifest;
}

String FindJavaMainClass(StringView code) {
  static const std::regex kClassPattern(R"(public\s+class\s+(\w+))");
  static const std::regex kPackagePattern(R"((?:^|[\n;])\s*package\s+([\w.]+)\s*;)");
  String source = code.to_string();
  std::smatch match;
  String main_class = "Main";
  if (std::regex_search(source, match, kClassPattern)) {
    main_class = match[1].str();
  }
  if (std::regex_search(source, match, kPackagePattern)) {
    main_class = match[1].str() + "." + main_class;
  }
  return main_class;
}

}  // namespace runbox
