#include "cfg.hpp"
#include "logger/logger.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fmt/core.h>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace fastuuid::cfg {

section_handler::section_handler(std::string name, const boost::property_tree::ptree &pt)
    : section_name_(std::move(name)), pt_(pt)
{
    // this maps several values to "0" and "1", which will be
    // converted to int or bool by means of T get<T>()
    bool_map_ = {{"true", "1"}, {"on", "1"}, {"1", "1"}, {"false", "0"}, {"off", "0"}, {"0", "0"}};
}


void section_handler::validate()
{
    using boost::algorithm::to_lower_copy;

    std::set<std::string> existing_opts;

    for (const auto &[key, value]: pt_) {
        std::string name = to_lower_copy(key);
        if (auto it = option_handlers_.find(name); it != option_handlers_.end()) {
            it->second(value.data());
            existing_opts.insert(name);
        } else {
            throw cfg_exception(fmt::format(R"(section "{}", invalid option "{}")", section_name_, name));
        }
    }

    fill_defaults(existing_opts);
}


void section_handler::set(const std::string &optname, const std::string &optval)
{
    const auto it = option_handlers_.find(boost::to_lower_copy(optname));
    if (it == option_handlers_.end())
        throw cfg_exception(fmt::format(R"(section "{}", invalid option "{}")", section_name_, optname));

    it->second(optval);
}


void section_handler::fill_defaults(const std::set<std::string> &opts)
{
    for (const auto &[key, handler]: option_handlers_) {
        if (opts.find(key) == opts.end()) {
            if (const auto dflt = defaults_.find(key); dflt != defaults_.end())
                handler(dflt->second);
        }
    }
}


void section_handler::process_bool(const std::string &optname, const std::string &optval)
{
    const auto it = bool_map_.find(boost::to_lower_copy(optval));
    if (it == bool_map_.end())
        throw cfg_exception(
            fmt::format(R"(section "{}", invalid value for "{}" ({}))", section_name_, optname, optval));

    options_[optname] = it->second;
}


void section_handler::process_integer(const std::string &optname, const std::string &optval, long long min,
                                      long long max)
{
    long long value = 0;
    try {
        value = boost::lexical_cast<long long>(optval);
    } catch (const boost::bad_lexical_cast &) {
        throw cfg_exception(fmt::format(R"(section "{}", invalid value for "{}" ({}). Integer expected.)",
                                        section_name_, optname, optval));
    }

    if (value < min || value > max)
        throw cfg_exception(fmt::format(R"(section "{}", value for "{}" ({}) out of range [{}, {}])", section_name_,
                                        optname, optval, min, max));

    options_[optname] = optval;
}


general_section_handler::general_section_handler(const std::string &name, const boost::property_tree::ptree &pt)
    : section_handler(name, pt)
{
    using boost::lexical_cast;
    using std::string;

    // defaults
    defaults_["log_type"] = "console";
    defaults_["log_facility"] = "user";
    defaults_["log_priority"] = "info";

    option_handlers_["log_type"] = [this](auto &&arg) { process_log_type(std::forward<decltype(arg)>(arg)); };
    log_type_map_ = {
        {"console", lexical_cast<string>(logger::console)},
        {"syslog", lexical_cast<string>(logger::syslog)},
    };
    option_handlers_["log_facility"] = [this](auto &&arg) { process_log_facility(std::forward<decltype(arg)>(arg)); };
    log_facility_map_ = {
        {"user", lexical_cast<string>(logger::facility_user)},
        {"daemon", lexical_cast<string>(logger::facility_daemon)},
        {"local0", lexical_cast<string>(logger::facility_local0)},
        {"local1", lexical_cast<string>(logger::facility_local1)},
        {"local2", lexical_cast<string>(logger::facility_local2)},
        {"local3", lexical_cast<string>(logger::facility_local3)},
        {"local4", lexical_cast<string>(logger::facility_local4)},
        {"local5", lexical_cast<string>(logger::facility_local5)},
        {"local6", lexical_cast<string>(logger::facility_local6)},
        {"local7", lexical_cast<string>(logger::facility_local7)},
    };
    option_handlers_["log_priority"] = [this](auto &&arg) { process_log_priority(std::forward<decltype(arg)>(arg)); };
    log_priority_map_ = {
        {"trace", lexical_cast<string>(logger::priority_trace)},
        {"debug", lexical_cast<string>(logger::priority_debug)},
        {"info", lexical_cast<string>(logger::priority_info)},
        {"warning", lexical_cast<string>(logger::priority_warn)},
        {"error", lexical_cast<string>(logger::priority_err)},
        {"critical", lexical_cast<string>(logger::priority_critical)},
    };
}


void general_section_handler::process_log_type(const std::string &optval)
{
    const auto it = log_type_map_.find(boost::to_lower_copy(optval));
    if (it == log_type_map_.end())
        throw cfg_exception(fmt::format(R"(section "{}", invalid value for "log_type" ({}))", GENERAL_SECTION, optval));

    options_["log_type"] = it->second;
}


void general_section_handler::process_log_facility(const std::string &optval)
{
    const auto it = log_facility_map_.find(boost::to_lower_copy(optval));
    if (it == log_facility_map_.end())
        throw cfg_exception(
            fmt::format(R"(section "{}", invalid value for "log_facility" ({}))", GENERAL_SECTION, optval));

    options_["log_facility"] = it->second;
}


void general_section_handler::process_log_priority(const std::string &optval)
{
    const auto it = log_priority_map_.find(boost::to_lower_copy(optval));
    if (it == log_priority_map_.end())
        throw cfg_exception(
            fmt::format(R"(section "{}", invalid value for "log_priority" ({}))", GENERAL_SECTION, optval));

    options_["log_priority"] = it->second;
}


generate_section_handler::generate_section_handler(const std::string &name, const boost::property_tree::ptree &pt)
    : section_handler(name, pt)
{
    using boost::lexical_cast;
    using std::string;

    defaults_["count"] = "1";
    defaults_["threads"] = "1";
    defaults_["format"] = "hex128";
    defaults_["print"] = "true";

    option_handlers_["count"] = [this](const std::string &arg) {
        process_integer("count", arg, 1, std::numeric_limits<long long>::max());
    };
    option_handlers_["threads"] = [this](const std::string &arg) { process_integer("threads", arg, 1, max_threads); };
    option_handlers_["format"] = [this](auto &&arg) { process_format(std::forward<decltype(arg)>(arg)); };
    format_map_ = {
        {"hex128", lexical_cast<string>(hex128)},
        {"raw", lexical_cast<string>(raw)},
    };
    option_handlers_["print"] = [this](const std::string &arg) { process_bool("print", arg); };
}


void generate_section_handler::process_format(const std::string &optval)
{
    const auto it = format_map_.find(boost::to_lower_copy(optval));
    if (it == format_map_.end())
        throw cfg_exception(fmt::format(R"(section "{}", invalid value for "format" ({}))", section_name_, optval));

    options_["format"] = it->second;
}


void cfg::init(const std::string &filename)
{
    boost::property_tree::ptree pt;
    try {
        boost::property_tree::read_ini(filename, pt);
    } catch (const boost::property_tree::ptree_error &e) {
        // convert boost::property_tree exceptions to cfg_exception
        throw cfg_exception(e.what());
    }
    load(pt);
}


void cfg::init()
{
    load(boost::property_tree::ptree{});
}


void cfg::load(const boost::property_tree::ptree &pt)
{
    general_section_.reset();
    generate_section_.reset();

    for (const auto &[key, node]: pt) {
        if (node.empty() && !node.data().empty())
            throw cfg_exception(fmt::format("configuration option outside of a section: {} = {}", key, node.data()));

        auto section = make_section(key, node);
        // read_ini() only catches duplicates that match exactly
        auto &slot = boost::iequals(key, GENERAL_SECTION) ? general_section_ : generate_section_;
        if (slot != nullptr)
            throw cfg_exception(fmt::format("duplicate section \"{}\"", key));

        section->validate();
        slot = section;
    }

    // absent sections take their defaults
    if (general_section_ == nullptr) {
        general_section_ = make_section(GENERAL_SECTION, boost::property_tree::ptree{});
        general_section_->validate();
    }
    if (generate_section_ == nullptr) {
        generate_section_ = make_section(GENERATE_SECTION, boost::property_tree::ptree{});
        generate_section_->validate();
    }
}


std::shared_ptr<section_handler> cfg::section(const std::string &sectionname) const
{
    std::shared_ptr<section_handler> section;
    if (boost::iequals(sectionname, GENERAL_SECTION))
        section = general_section_;
    else if (boost::iequals(sectionname, GENERATE_SECTION))
        section = generate_section_;

    if (section == nullptr)
        throw cfg_exception(fmt::format("section \"{}\" does not exist", sectionname));

    return section;
}


std::shared_ptr<section_handler> cfg::make_section(const std::string &name, const boost::property_tree::ptree &node)
{
    if (boost::iequals(name, GENERAL_SECTION))
        return std::make_shared<general_section_handler>(GENERAL_SECTION, node);
    if (boost::iequals(name, GENERATE_SECTION))
        return std::make_shared<generate_section_handler>(GENERATE_SECTION, node);

    throw cfg_exception(fmt::format("unknown section \"{}\"", name));
}

} // namespace fastuuid::cfg
