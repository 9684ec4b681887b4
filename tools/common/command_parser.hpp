#ifndef SSHKIT_TOOLS_COMMON_COMMAND_PARSER_HEADER
#define SSHKIT_TOOLS_COMMON_COMMAND_PARSER_HEADER

#include <chrono>
#include <optional>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <type_traits>

namespace sshkit {

struct invalid_argument : std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct option_value {
	virtual ~option_value() {}
	virtual void parse(std::vector<std::string> const&) = 0;
	virtual void print(std::ostream&) const = 0;
};

struct option {
	option(std::string n, std::string a, std::string i, std::unique_ptr<option_value> v)
	: name(std::move(n))
	, alias(std::move(a))
	, info(std::move(i))
	, value(std::move(v))
	{}

	std::string name;
	std::string alias;
	std::string info;
	std::unique_ptr<option_value> value;
};

/** \brief Command line and config file option parser
 *
 *  Options are given as "--name value..." or "-alias value...", values that contain white space are quoted.
 *  A config file has the same syntax, one or more options per line, lines starting with # are ignored.
 */
class command_parser {
public:
	command_parser(bool show_value_in_help = true)
	: show_value_in_help_(show_value_in_help)
	{}

	template<typename T>
	void add(T& var, std::string name, std::string alias, std::string info);
	template<typename T>
	void add(std::vector<T>& var, std::string name, std::string alias, std::string info);

	/// named parameter with optional value, the optional is set with default constructed T in case there is no value
	template<typename T>
	void add(std::optional<T>& var, std::string name, std::string alias, std::string info);
	void add(bool& var, std::string name, std::string alias, std::string info);
	/// adds also "no-<name>" that sets the value to false
	void add(std::optional<bool>& var, std::string name, std::string alias, std::string info);
	/// value given in milliseconds
	void add(std::chrono::milliseconds& var, std::string name, std::string alias, std::string info);

	void parse(int argc, char* args[]);
	void parse(std::istream&);
	void parse(std::string);

	/// throws invalid_argument if the file cannot be read
	void parse_file(std::string const& file_name);

	void print_help(std::ostream&);
private:
	template<typename Value, typename T>
	void add_impl(T& var, std::string name, std::string alias, std::string info);
	std::string parse_name(std::istream& in);
	std::string parse_quoted(std::istream& in);
	std::string parse_arg(std::istream& in);
	void parse_args(std::istream& in, std::string const& name);
private:
	std::map<std::string, std::shared_ptr<option>> options_;
	bool const show_value_in_help_;
};

template<typename Container>
std::ostream& print_list(std::ostream& out, Container const& c, std::string_view separator, std::string_view quote = "") {
	bool first = true;
	for(auto&& v : c) {
		if(!first) {
			out << separator;
		}
		first = false;
		out << quote << v << quote;
	}
	return out;
}

template<typename T>
T from_argument(std::string const& arg) {
	if constexpr(std::is_same_v<std::string, T>) {
		return arg;
	} else {
		T v{};
		std::istringstream in(arg);
		if(!(in >> v) || !(in >> std::ws).eof()) {
			throw invalid_argument("failed to interpret argument '" + arg + "'");
		}
		return v;
	}
}

template<typename T>
struct single_value : option_value {
	single_value(T& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() != 1) {
			std::ostringstream out;
			print_list(out, args, ",");
			throw invalid_argument("expected one argument: [" + out.str() + "]");
		}
		value_ = from_argument<T>(args[0]);
	}
	void print(std::ostream& o) const override {
		o << value_;
	}

	T& value_;
};

template<typename T>
struct vector_value : option_value {
	vector_value(std::vector<T>& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		value_.clear();
		for(auto&& v : args) {
			value_.push_back(from_argument<T>(v));
		}
	}
	void print(std::ostream& o) const override {
		print_list(o, value_, ", ");
	}

	std::vector<T>& value_;
};

template<typename T>
struct optional_value : option_value {
	optional_value(std::optional<T>& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() > 1) {
			std::ostringstream out;
			print_list(out, args, ",");
			throw invalid_argument("expected at most one argument: [" + out.str() +"]");
		}
		value_ = args.empty() ? T{} : from_argument<T>(args[0]);
	}
	void print(std::ostream& o) const override {
		if(value_) {
			o << *value_;
		} else {
			o << "<value not set>";
		}
	}

	std::optional<T>& value_;
};

template<typename Value, typename T>
void command_parser::add_impl(T& var, std::string name, std::string alias, std::string info) {
	auto v = std::make_unique<Value>(var);
	auto p = std::make_shared<option>(name, alias, std::move(info), std::move(v));
	if(!name.empty()) {
		options_.insert({"--"+name, p});
	}
	if(!alias.empty()) {
		options_.insert({"-"+alias, p});
	}
}

template<typename T>
void command_parser::add(T& var, std::string name, std::string alias, std::string info) {
	add_impl<single_value<T>>(var, std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add(std::vector<T>& var, std::string name, std::string alias, std::string info) {
	add_impl<vector_value<T>>(var, std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add(std::optional<T>& var, std::string name, std::string alias, std::string info) {
	add_impl<optional_value<T>>(var, std::move(name), std::move(alias), std::move(info));
}

}

#endif
