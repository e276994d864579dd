#if !defined(GRAMMAR_H)
#define GRAMMAR_H
/*
 * Grammar definition: named Rules, each a Sequence of Elements.
 *
 * An Element is one of:
 *	Char		match that one character
 *	Range		match one character in the inclusive range lo..hi
 *	rule name	call another Rule, looked up by name when matching
 *	Alternatives	a group of Sequences, of which one must match
 *	Sequence	a nested Sequence, stored as a group with one alternative
 *
 * Characters are UCS4 code points, not bytes. A Char or Range may be given
 * as a code point or as a UTF-8 string containing exactly one character.
 *
 * Example:
 *	Grammar	g;
 *	g.add_rule("digit", Sequence{Range('0', '9')}, Attributes(Attributes::Token))
 *	 .add_rule("pair", Sequence{"digit", Char(','), "digit"});
 *
 * Rules may be added in any order, because names are only resolved when
 * matching. Rule names (in add_rule and in calls) are copied, and the copies
 * are shared when an Element or a Grammar is copied.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstring>
#include	<initializer_list>
#include	<map>
#include	<vector>

#include	<utf8.h>
#include	<refcount.h>
#include	<error.h>

class	Sequence;
class	Alternatives;
class	GroupBody;

class	Attributes
{
public:
	enum Type
	{
		None,		// A structural rule
		Token		// An atomic rule: succeeds or fails as a unit, internals are opaque
	};

	Attributes(Type _type = None) : type(_type) {}

	bool		is_token() const { return type == Token; }

	Type		type;
};

class	Char
{
public:
	Char(UCS4 _ch) : ch(_ch) {}
	Char(const UTF8* s) : ch(UTF8Single(s)) {}	// Must contain exactly one character

	bool		is_valid() const { return UCS4IsUnicode(ch); }

	UCS4		ch;
};

class	Range
{
public:
	Range(UCS4 _lo, UCS4 _hi) : lo(_lo), hi(_hi) {}
	Range(const UTF8* _lo, const UTF8* _hi) : lo(UTF8Single(_lo)), hi(UTF8Single(_hi)) {}

	bool		is_valid() const { return UCS4IsUnicode(lo) && UCS4IsUnicode(hi) && lo <= hi; }

	UCS4		lo;
	UCS4		hi;
};

class	Element
{
public:
	enum Type { CharMatch, RangeMatch, RuleCall, Group };

	Element(const Char& c);
	Element(const Range& r);
	Element(const char* rule_name);
	Element(const Alternatives& alternatives);
	Element(const Sequence& sequence);
	Element(const Element& e);
	Element&	operator=(const Element& e);
	~Element();

	Type		type() const { return element_type; }

	// CharMatch and RangeMatch:
	bool		matches(UCS4 c) const { return c >= lo && c <= hi; }
	bool		is_valid() const;

	// RuleCall:
	const char*	rule_name() const { return name; }

	// Group:
	const Alternatives&	alternatives() const;

	// How a failure of this CharMatch or RangeMatch is described:
	Expectation	expectation() const;

private:
	Type		element_type;
	UCS4		lo;		// For a CharMatch, lo == hi
	UCS4		hi;
	const char*	name;		// Points into name_copy
	Ref<SharedName>	name_copy;
	Ref<GroupBody>	group;
};

class	Sequence
{
public:
	Sequence() {}
	Sequence(std::initializer_list<Element> _elements) : elements(_elements) {}

	int		length() const { return (int)elements.size(); }
	const Element&	operator[](int i) const { return elements[i]; }
	Sequence&	append(const Element& e) { elements.push_back(e); return *this; }

private:
	std::vector<Element>	elements;
};

class	Alternatives
{
public:
	Alternatives() {}
	Alternatives(std::initializer_list<Sequence> _sequences) : sequences(_sequences) {}

	int		length() const { return (int)sequences.size(); }
	const Sequence&	operator[](int i) const { return sequences[i]; }
	Alternatives&	append(const Sequence& s) { sequences.push_back(s); return *this; }

private:
	std::vector<Sequence>	sequences;
};

// A shared, immutable Alternatives group inside an Element
class	GroupBody
: public RefCounted
{
public:
	GroupBody(const Alternatives& a) : alternatives(a) {}

	const Alternatives	alternatives;
};

class	Rule
{
public:
	Rule(const Ref<SharedName>& _name, const Sequence& _body, Attributes _attributes)
	: name(_name->c_str()), body(_body), attributes(_attributes), name_copy(_name)
	{}

	bool		is_token() const { return attributes.is_token(); }

	const char*	name;		// Points into name_copy, which the Grammar's index also uses
	Sequence	body;
	Attributes	attributes;
	Ref<SharedName>	name_copy;
};

class	Grammar
{
public:
	Grammar() {}

	// Add a rule, or replace the rule of the same name (which keeps its position)
	Grammar&	add_rule(const char* name, const Sequence& body, Attributes attributes = Attributes());

	const Rule*	lookup(const char* name) const;		// null if no such rule

	// Rules in the order they were first added:
	int		rule_count() const { return (int)rules.size(); }
	const Rule&	rule(int i) const { return rules[i]; }

	// The first configuration error recorded by add_rule, if any. It has no input location.
	Error		error() const { return config_error; }

private:
	struct NameLess
	{
		bool	operator()(const char* a, const char* b) const { return strcmp(a, b) < 0; }
	};

	std::vector<Rule>	rules;
	std::map<const char*, int, NameLess>	index;	// Rule name (in the Rule's own copy) to position in rules
	Error		config_error;

	void		validate(const char* rule_name, const Sequence& sequence);
	void		record_error(Error::Type type, const char* rule_name);
};

#endif	// GRAMMAR_H
