#include "command_parser.hpp"

#include <fstream>

namespace sshkit {

void command_parser::parse(int argc, char* args[]) {
	std::string s;
	for(int i = 1; i != argc; ++i) {
		if(i > 1) {
			s += " ";
		}
		std::string arg = args[i];
		if(arg.empty() || arg.find_first_of(" \t") != std::string::npos) {
			arg = '"' + arg + '"';
		}
		s += arg;
	}
	parse(s);
}

void command_parser::parse(std::string s) {
	std::istringstream in(s);
	parse(in);
}

static bool at_end(std::istream& in) {
	return in.peek() == std::char_traits<char>::eof();
}

std::string command_parser::parse_name(std::istream& in) {
	std::string s;
	in >> s;
	return s;
}

std::string command_parser::parse_quoted(std::istream& in) {
	std::string s;
	in.ignore(); //the start of quote
	for(int c = in.get(); c != '"'; c = in.get()) {
		if(c == std::char_traits<char>::eof()) {
			throw invalid_argument("missing closing quote: \"" + s);
		}
		s += char(c);
	}
	return s;
}

std::string command_parser::parse_arg(std::istream& in) {
	std::string s;
	if(in.peek() == '"') {
		s = parse_quoted(in);
	} else {
		in >> s;
	}
	return s;
}

void command_parser::parse_args(std::istream& in, std::string const& name) {
	auto it = options_.find(name);
	if(it == options_.end()) {
		throw invalid_argument("no option named '" + name + "'");
	}

	std::vector<std::string> args;
	for(;in >> std::ws && !at_end(in) && in.peek() != '-';) {
		args.push_back(parse_arg(in));
	}

	it->second->value->parse(args);
}

void command_parser::parse(std::istream& in) {
	for(; in >> std::ws && !at_end(in); ) {
		if(in.peek() == '-') {
			parse_args(in, parse_name(in));
		} else {
			throw invalid_argument("unexpected argument '" + parse_arg(in) + "'");
		}
	}
}

namespace {

struct print_align {
	print_align(std::ostream& out)
	: out_(out)
	{}

	~print_align () {
		out_ << temp_out_.str();
	}

	template<typename T>
	print_align& operator<<(T const& v) {
		temp_out_ << v;
		return *this;
	}

	print_align& align(std::size_t s) {
		std::string str = temp_out_.str().substr(0, s);
		out_ << str << std::string(s-str.size(), ' ');
		temp_out_.clear();
		temp_out_.str("");
		return *this;
	}

	std::ostringstream temp_out_;
	std::ostream& out_;
};

}

void command_parser::print_help(std::ostream& out) {
	for(auto&& v : options_) {
		if(v.first.starts_with("--")) {
			auto const& info = *v.second;
			std::string alias;
			if(!info.alias.empty()) {
				alias = ", -" + info.alias;
			}

			(print_align(out) << "--" << info.name << alias).align(40) << " " << info.info;

			if(show_value_in_help_) {
				std::ostringstream value_out;
				info.value->print(value_out);
				if(!value_out.str().empty()) {
					out << " (" + value_out.str() + ")";
				}
			}
			out << std::endl;
		}
	}
}

void command_parser::parse_file(std::string const& file_name) {
	std::ifstream is(file_name);
	if(!is) {
		throw invalid_argument("cannot read config file '" + file_name + "'");
	}
	std::string line;
	while(std::getline(is, line)) {
		auto pos = line.find_first_not_of(" \t");
		if(pos != std::string::npos && line[pos] != '#') {
			parse(line);
		}
	}
}

struct bool_value : option_value {
	bool_value(bool& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(!args.empty()) {
			throw invalid_argument("flag takes no arguments");
		}
		value_ = true;
	}
	void print(std::ostream& o) const override {
		o << (value_ ? "true" : "false");
	}

	bool& value_;
};

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	add_impl<bool_value>(var, std::move(name), std::move(alias), std::move(info));
}

template<bool Value>
struct optional_bool_value : option_value {
	optional_bool_value(std::optional<bool>& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const&) override {
		value_ = Value;
	}

	void print(std::ostream& o) const override {
		if(value_) {
			o << (*value_ ? "true" : "false");
		}
	}

	std::optional<bool>& value_;
};

void command_parser::add(std::optional<bool>& var, std::string name, std::string alias, std::string info) {
	add_impl<optional_bool_value<true>>(var, name, alias, info);
	add_impl<optional_bool_value<false>>(var, "no-" + name, alias.empty() ? alias : "no-" + alias, "Unset: " + info);
}

struct milliseconds_value : option_value {
	milliseconds_value(std::chrono::milliseconds& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() != 1) {
			throw invalid_argument("expected one argument in milliseconds");
		}
		value_ = std::chrono::milliseconds(from_argument<std::int64_t>(args[0]));
	}
	void print(std::ostream& o) const override {
		o << value_.count() << "ms";
	}

	std::chrono::milliseconds& value_;
};

void command_parser::add(std::chrono::milliseconds& var, std::string name, std::string alias, std::string info) {
	add_impl<milliseconds_value>(var, std::move(name), std::move(alias), std::move(info));
}

}
