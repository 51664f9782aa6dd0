#pragma once
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ptree.hpp>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

namespace fastuuid::cfg {

inline const std::string GENERAL_SECTION = "general";
inline const std::string GENERATE_SECTION = "generate";

enum output_format_enum { hex128, raw };


class cfg_exception : public std::runtime_error {
public:
    cfg_exception()
        : runtime_error{"N/A"}
    { }

    explicit cfg_exception(const std::string &what)
        : runtime_error{what}
    { }
};


// base class for section handlers
class section_handler {
public:
    using OptionHandler = std::function<void(const std::string &)>;

    section_handler(std::string name, const boost::property_tree::ptree &pt);
    virtual ~section_handler() = default;

    void validate();
    // assigns a single option after validate(), e.g. from the command line
    void set(const std::string &optname, const std::string &optval);
    template<typename T> T get(const std::string &optname) const;
    std::string name() const;

private:
    void fill_defaults(const std::set<std::string> &opts);

protected:
    void process_bool(const std::string &optname, const std::string &optval);
    void process_integer(const std::string &optname, const std::string &optval, long long min, long long max);

protected:
    std::string section_name_;
    boost::property_tree::ptree pt_;

    // map holding the options. All values are stored as strings.
    std::map<std::string, std::string> options_;

    // map of valid options and the associated handler for the value
    std::map<std::string, OptionHandler> option_handlers_;
    // map holding default values
    std::map<std::string, std::string> defaults_;

    // --- helper maps
    // map used for true/false options
    std::map<std::string, std::string> bool_map_;
};


class general_section_handler final : public section_handler {
public:
    general_section_handler(const std::string &name, const boost::property_tree::ptree &pt);

private:
    void process_log_type(const std::string &optval);
    void process_log_facility(const std::string &optval);
    void process_log_priority(const std::string &optval);

private:
    // helper maps
    std::map<std::string, std::string> log_type_map_;
    std::map<std::string, std::string> log_facility_map_;
    std::map<std::string, std::string> log_priority_map_;
};


class generate_section_handler final : public section_handler {
public:
    generate_section_handler(const std::string &name, const boost::property_tree::ptree &pt);

    static constexpr long long max_threads = 1024;

private:
    void process_format(const std::string &optval);

private:
    std::map<std::string, std::string> format_map_;
};


class cfg {
public:
    cfg() = default;
    cfg(const cfg &) = delete;
    cfg &operator=(const cfg &) = delete;

    // Loads an INI file. Sections that are absent get their defaults.
    void init(const std::string &filename);
    // Defaults only, no file.
    void init();
    std::shared_ptr<section_handler> section(const std::string &sectionname) const;

private:
    void load(const boost::property_tree::ptree &pt);
    static std::shared_ptr<section_handler> make_section(const std::string &name,
                                                         const boost::property_tree::ptree &node);

private:
    std::shared_ptr<section_handler> general_section_;
    std::shared_ptr<section_handler> generate_section_;
};


template<typename T> T section_handler::get(const std::string &optname) const
{
    const auto it = options_.find(optname);
    if (it == options_.end())
        throw cfg_exception("Option \"" + optname + "\" is invalid in section \"" + section_name_ + "\"");

    return boost::lexical_cast<T>(it->second);
}


// boost::lexical_cast is not aware of output_format_enum, hence the specialization
template<> inline output_format_enum section_handler::get(const std::string &optname) const
{
    return static_cast<output_format_enum>(get<long>(optname));
}


inline std::string section_handler::name() const
{
    return section_name_;
}

} // namespace fastuuid::cfg
