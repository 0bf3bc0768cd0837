/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/kessan_conf_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/rapidjson.h>
#include <boost/range/adaptor/map.hpp>
#include <boost/throw_exception.hpp>
#include "common/files.hpp"
#include "common/result.hpp"
#include "logger/logger.hpp"
#include "main/kessan_conf_literals.hpp"

/// The length of the string around the error place to print in case of JSON
/// syntax error.
static constexpr size_t kBadJsonPrintLength = 15;

/// The offset of printed chunk towards file start from the error position.
static constexpr size_t kBadJsonPrintOffsset = 5;

static char const *kEnvVarPrefix = "KESSAN";

static_assert(kBadJsonPrintOffsset <= kBadJsonPrintLength,
              "The place of error is out of the printed string boundaries!");

using ConstJsonValRef = std::reference_wrapper<rapidjson::Value const>;

class ConfigParsingException : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

std::optional<std::string> getOptEnvRaw(
    const std::string &key, const std::optional<logger::LoggerPtr> &log) {
  char const *val = getenv(key.c_str());
  if (log) {
    log.value()->trace(
        "lookup ENV({}){}",
        key,
        val ? fmt::format(" = {}", val) : std::string{": not set"});
  }
  if (not val) {
    return std::nullopt;
  }
  return std::string{val};
}

/**
 * Throws a runtime exception if the given condition is false.
 * @param condition
 * @param error - error message
 */
inline void assert_fatal(bool condition,
                         std::string_view printable_path,
                         std::string error) {
  if (!condition) {
    throw ConfigParsingException(fmt::format("{}: {}", printable_path, error));
  }
}

inline logger::LogLevel getLogLevel(std::string level_str,
                                    std::string_view printable_path) {
  const auto it = config_members::LogLevels.find(level_str);
  assert_fatal(it != config_members::LogLevels.end(),
               printable_path,
               fmt::format("wrong log level `{}': must be one of `{}'",
                           level_str,
                           fmt::join(config_members::LogLevels
                                         | boost::adaptors::map_keys,
                                     "', `")));
  return it->second;
}

/// `working database' under DATABASE becomes DATABASE_WORKING_DATABASE
std::string makeEnvDictChildKey(std::string_view base_path,
                                std::string_view child_key) {
  std::string child_key_upper;
  std::transform(child_key.begin(),
                 child_key.end(),
                 std::back_inserter(child_key_upper),
                 [](unsigned char c) -> char {
                   return c == ' ' ? '_' : static_cast<char>(std::toupper(c));
                 });
  return base_path.empty() ? child_key_upper
                           : fmt::format("{}_{}", base_path, child_key_upper);
}

/**
 * A class for reading a structure from a JSON node, or from the environment
 * where the node is absent.
 */
class JsonDeserializerImpl {
 public:
  JsonDeserializerImpl(std::optional<ConstJsonValRef> json,
                       std::optional<logger::LoggerPtr> log)
      : env_path_(kEnvVarPrefix),
        json_(json),
        printable_path_(""),
        log_(std::move(log)) {}

  /**
   * Load the data from the node. Checks the JSON type and throws
   * exception if it is wrong or the value is missing.
   * @tparam TDest - the type of data to read
   * @return the deserialized data
   */
  template <typename TDest>
  TDest deserialize() {
    TDest dest;
    assert_fatal(loadInto(dest), "deserialization failed");
    return dest;
  }

 private:
  JsonDeserializerImpl(std::optional<std::string> env_path,
                       std::optional<ConstJsonValRef> json,
                       std::string printable_path,
                       std::optional<logger::LoggerPtr> log)
      : env_path_(std::move(env_path)),
        json_(json),
        printable_path_(std::move(printable_path)),
        log_(std::move(log)) {}

  JsonDeserializerImpl getDictChild(std::string const &key) {
    std::optional<ConstJsonValRef> child_json;
    if (json_) {
      assert_fatal(json_->get().IsObject(), "must be a JSON object.");
      auto const json_obj = json_->get().GetObject();
      const auto it = json_obj.FindMember(key.c_str());
      if (it != json_obj.MemberEnd()) {
        child_json = it->value;
      }
    }
    std::optional<std::string> child_env_path;
    if (env_path_) {
      child_env_path = makeEnvDictChildKey(*env_path_, key);
    }
    return JsonDeserializerImpl{std::move(child_env_path),
                                child_json,
                                fmt::format("{}/{}", printable_path_, key),
                                log_};
  }

  /// Children of a JSON object; dictionaries cannot be given in environment
  template <typename F>
  bool iterateDictChildren(F f) {
    if (not json_) {
      return false;
    }
    assert_fatal(json_->get().IsObject(), "must be a JSON object.");
    auto const json_obj = json_->get().GetObject();
    for (const auto &child_json : json_obj) {
      auto const key = child_json.name.GetString();
      f(key,
        JsonDeserializerImpl{std::nullopt,
                             child_json.value,
                             fmt::format("{}/{}", printable_path_, key),
                             log_});
    }
    return true;
  }

  inline void assert_fatal(bool condition, std::string error) {
    ::assert_fatal(condition, printable_path_, error);
  }

  std::optional<std::string> getOptEnvRaw() const {
    if (not env_path_) {
      return std::nullopt;
    }
    return ::getOptEnvRaw(*env_path_, log_);
  }

  // ------------ loadInto(dst) ------------
  // loadInto is a set of functions that load the value of this node to a
  // given destination variable. They return false if the value is absent,
  // and throw if it has a wrong type.

  template <typename T>
  static constexpr bool IsIntegerLike = std::numeric_limits<T>::is_integer
      and not std::is_same<T, bool>::value;

  template <typename T>
  static constexpr bool fitsType(int64_t i) {
    return static_cast<int64_t>(std::numeric_limits<T>::min()) <= i
        and i <= static_cast<int64_t>(std::numeric_limits<T>::max());
  }

  template <typename TDest>
  typename std::enable_if_t<IsIntegerLike<TDest>, bool> loadInto(
      TDest &dest) {
    int64_t val;
    if (json_) {
      assert_fatal(json_->get().IsInt64(), "must be an integer");
      val = json_->get().GetInt64();
    } else if (auto from_env = getOptEnvRaw()) {
      char *end = nullptr;
      val = std::strtoll(from_env->c_str(), &end, 10);
      assert_fatal(end != from_env->c_str() and *end == '\0',
                   fmt::format("`{}' is not an integer", *from_env));
    } else {
      return false;
    }
    assert_fatal(fitsType<TDest>(val), "integer value out of range");
    dest = static_cast<TDest>(val);
    return true;
  }

  template <typename T>
  bool loadInto(std::shared_ptr<T> &dest) {
    std::unique_ptr<T> uniq_dest;
    if (not loadInto<std::unique_ptr<T>>(uniq_dest)) {
      return false;
    }
    dest = std::move(uniq_dest);
    return true;
  }

  template <typename T>
  inline bool loadInto(boost::optional<T> &dest) {
    T val;
    if (loadInto(val)) {
      dest = std::move(val);
    }
    return true;
  }

  // This is the fallback template function specialization that is overriden by
  // multiple explicit specializations below.
  template <typename TDest>
  typename std::enable_if_t<not IsIntegerLike<TDest>, bool> loadInto(TDest &) {
    BOOST_THROW_EXCEPTION(
        ConfigParsingException("Wrong type. Should never reach here."));
    return false;
  }

  // ------------ end of loadInto(dst) ------------

  /**
   * Adds the children logger configs from parent logger JSON object to parent
   * logger config.
   * @param parent_config - the parent logger config
   */
  bool addChildrenLoggerConfigs(logger::LoggerManagerTree &parent_config);

  /**
   * Overrides the logger configuration with the values from JSON object.
   * @param cfg - the configuration to use as base
   */
  void updateLoggerConfig(logger::LoggerConfig &cfg);

  /**
   * Gets an optional value by a key from a JSON object.
   * @param key - the key for the requested value
   * @return the value if present, otherwise boost::none.
   */
  template <typename TDest, typename TKey>
  boost::optional<TDest> getOptValByKey(const TKey &key) {
    TDest val;
    return boost::make_optional(getDictChild(key).loadInto(val), val);
  }

  std::optional<std::string> env_path_;
  std::optional<ConstJsonValRef> json_;
  std::string printable_path_;
  std::optional<logger::LoggerPtr> log_;
};

// ------------ loadInto(dst) specializations ------------

template <>
inline bool JsonDeserializerImpl::loadInto(std::string &dest) {
  if (json_) {
    assert_fatal(json_->get().IsString(), "must be a string");
    dest = json_->get().GetString();
    return true;
  } else if (auto from_env = getOptEnvRaw()) {
    dest = std::move(from_env).value();
    return true;
  }
  return false;
}

template <>
inline bool JsonDeserializerImpl::loadInto(logger::LogLevel &dest) {
  std::string level_str;
  if (not loadInto(level_str)) {
    return false;
  }
  dest = getLogLevel(level_str, printable_path_);
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(logger::LogPatterns &dest) {
  return iterateDictChildren(
      [&](std::string_view level, JsonDeserializerImpl pattern_raw) {
        std::string pattern_str;
        pattern_raw.loadInto(pattern_str);
        dest.setPattern(getLogLevel(std::string{level}, printable_path_),
                        pattern_str);
      });
}

template <>
inline bool JsonDeserializerImpl::loadInto(bool &dest) {
  if (json_) {
    assert_fatal(json_->get().IsBool(), "must be a boolean");
    dest = json_->get().GetBool();
    return true;
  } else if (auto from_env = getOptEnvRaw()) {
    static const std::string_view kTextFalse[] = {"false", "f", "0"};
    static const std::string_view kTextTrue[] = {"true", "t", "1"};
    std::string from_env_lower;
    std::transform(from_env->begin(),
                   from_env->end(),
                   std::back_inserter(from_env_lower),
                   ::tolower);
    auto has_elem = [](auto const &collection, auto const &elem) {
      return std::find(std::begin(collection), std::end(collection), elem)
          != std::end(collection);
    };
    if (has_elem(kTextFalse, from_env_lower)) {
      dest = false;
      return true;
    }
    if (has_elem(kTextTrue, from_env_lower)) {
      dest = true;
      return true;
    }
    assert_fatal(false,
                 fmt::format("`{}' is not a boolean", from_env_lower));
  }
  return false;
}

template <>
inline bool JsonDeserializerImpl::loadInto(
    std::unique_ptr<logger::LoggerManagerTree> &dest) {
  logger::LoggerConfig root_config{logger::kDefaultLogLevel,
                                   logger::LogPatterns{}};
  updateLoggerConfig(root_config);
  dest = std::make_unique<logger::LoggerManagerTree>(
      std::make_shared<const logger::LoggerConfig>(std::move(root_config)));
  addChildrenLoggerConfigs(*dest);
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(KessanConfig::DbConfig &dest) {
  using namespace config_members;
  if (not getDictChild(DbType).loadInto(dest.type)) {
    return false;
  }
  if (dest.type == kDbTypeSqlite) {
    return getDictChild(DbPath).loadInto(dest.path);
  }
  if (dest.type == kDbTypePostgres) {
    return getDictChild(Host).loadInto(dest.host)
        and getDictChild(Port).loadInto(dest.port)
        and getDictChild(User).loadInto(dest.user)
        and getDictChild(Password).loadInto(dest.password)
        and getDictChild(WorkingDbName).loadInto(dest.working_dbname)
        and getDictChild(MaintenanceDbName).loadInto(dest.maintenance_dbname);
  }
  assert_fatal(false,
               fmt::format("unknown database type `{}': must be `{}' or `{}'",
                           dest.type,
                           kDbTypePostgres,
                           kDbTypeSqlite));
  return false;
}

template <>
inline bool JsonDeserializerImpl::loadInto(KessanConfig &dest) {
  using namespace config_members;
  return getDictChild(DbConfig).loadInto(dest.database_config)
      and getDictChild(FallbackAccount).loadInto(dest.fallback_account)
      and getDictChild(SeedDefaultAccounts).loadInto(dest.seed_default_accounts)
      and getDictChild(LogSection).loadInto(dest.logger_manager);
}

// ------------ end of loadInto(dst) specializations ------------

bool JsonDeserializerImpl::addChildrenLoggerConfigs(
    logger::LoggerManagerTree &parent_config) {
  return getDictChild(config_members::LogChildrenSection)
      .iterateDictChildren([&](std::string_view child_name,
                               JsonDeserializerImpl child_conf_raw) {
        auto child_conf = parent_config.registerChild(
            std::string{child_name},
            child_conf_raw.getOptValByKey<logger::LogLevel>(
                config_members::LogLevel),
            child_conf_raw.getOptValByKey<logger::LogPatterns>(
                config_members::LogPatternsSection));
        child_conf_raw.addChildrenLoggerConfigs(*child_conf);
      });
}

void JsonDeserializerImpl::updateLoggerConfig(logger::LoggerConfig &cfg) {
  getDictChild(config_members::LogLevel).loadInto(cfg.log_level);
  getDictChild(config_members::LogPatternsSection).loadInto(cfg.patterns);
}

void reportJsonParsingError(const rapidjson::Document &doc,
                            const std::string &text) {
  if (doc.HasParseError()) {
    const size_t error_offset = doc.GetErrorOffset();
    // This ensures the unsigned string beginning position does not cross zero:
    const size_t print_offset =
        std::max(error_offset, kBadJsonPrintOffsset) - kBadJsonPrintOffsset;
    std::string json_error_buf = text.substr(print_offset, kBadJsonPrintLength);
    throw ConfigParsingException{fmt::format(
        "JSON parse error (near `{}'): {}",
        json_error_buf,
        std::string(rapidjson::GetParseError_En(doc.GetParseError())))};
  }
}

boost::optional<std::string> KessanConfig::getFallbackAccount() const {
  if (not fallback_account) {
    return kDefaultFallbackAccount;
  }
  if (fallback_account->empty()) {
    return boost::none;
  }
  return fallback_account;
}

bool KessanConfig::getSeedDefaultAccounts() const {
  return seed_default_accounts.value_or(true);
}

kessan::expected::Result<KessanConfig, std::string> parse_kessan_config(
    const std::string &conf_path, std::optional<logger::LoggerPtr> log) {
  std::optional<std::string> config_text;
  if (not conf_path.empty()) {
    auto config_text_result = kessan::readTextFile(conf_path);
    if (auto e = kessan::expected::resultToOptionalError(config_text_result)) {
      return kessan::expected::makeError(std::move(e).value());
    }
    config_text = std::move(config_text_result).assumeValue();
  }

  try {
    rapidjson::Document doc;
    std::optional<ConstJsonValRef> root;
    if (config_text) {
      doc.Parse(config_text->data(), config_text->size());
      reportJsonParsingError(doc, *config_text);
      root = std::cref(static_cast<const rapidjson::Value &>(doc));
    }

    JsonDeserializerImpl parser(root, std::move(log));
    return kessan::expected::makeValue(parser.deserialize<KessanConfig>());
  } catch (ConfigParsingException const &e) {
    return kessan::expected::makeError(std::string{e.what()});
  }
}
