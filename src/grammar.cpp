/*
 * Grammar definition: Elements, and the Rule table
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<grammar.h>

Element::Element(const Char& c)
: element_type(CharMatch), lo(c.ch), hi(c.ch), name(0), name_copy(), group()
{}

Element::Element(const Range& r)
: element_type(RangeMatch), lo(r.lo), hi(r.hi), name(0), name_copy(), group()
{}

Element::Element(const char* rule_name)
: element_type(RuleCall), lo(UCS4_NONE), hi(UCS4_NONE), name(0)
, name_copy(rule_name ? new SharedName(rule_name) : 0), group()
{
	if (name_copy)
		name = name_copy->c_str();
}

Element::Element(const Alternatives& alternatives)
: element_type(Group), lo(UCS4_NONE), hi(UCS4_NONE), name(0), name_copy(), group(new GroupBody(alternatives))
{}

Element::Element(const Sequence& sequence)
: element_type(Group), lo(UCS4_NONE), hi(UCS4_NONE), name(0), name_copy(), group(new GroupBody(Alternatives{sequence}))
{}

Element::Element(const Element& e)
: element_type(e.element_type), lo(e.lo), hi(e.hi), name(e.name), name_copy(e.name_copy), group(e.group)
{}

Element&
Element::operator=(const Element& e)
{
	element_type = e.element_type;
	lo = e.lo;
	hi = e.hi;
	name = e.name;
	name_copy = e.name_copy;
	group = e.group;
	return *this;
}

Element::~Element()
{}

bool
Element::is_valid() const
{
	switch (element_type)
	{
	case CharMatch:
		return UCS4IsUnicode(lo);
	case RangeMatch:
		return UCS4IsUnicode(lo) && UCS4IsUnicode(hi) && lo <= hi;
	case RuleCall:
		return name != 0 && *name != '\0';
	case Group:
		return group != 0;
	}
	return false;
}

const Alternatives&
Element::alternatives() const
{
	return group->alternatives;
}

Expectation
Element::expectation() const
{
	Expectation	e;
	e.kind = element_type == CharMatch ? Expectation::Literal : Expectation::CharRange;
	e.lo = lo;
	e.hi = hi;
	e.name = 0;
	if (element_type == RuleCall)
	{
		e.kind = Expectation::RuleName;
		e.name = name;
	}
	return e;
}

Grammar&
Grammar::add_rule(const char* name, const Sequence& body, Attributes attributes)
{
	if (name == 0 || *name == '\0')
	{
		record_error(Error::EmptyRuleName, 0);
		return *this;
	}

	validate(name, body);

	std::map<const char*, int, NameLess>::iterator	existing = index.find(name);
	if (existing != index.end())
	{		// Replace the rule, keeping its original position and the name the index points to
		Rule&	rule = rules[existing->second];
		rule = Rule(rule.name_copy, body, attributes);
		return *this;
	}

	Ref<SharedName>	name_copy(new SharedName(name));
	rules.push_back(Rule(name_copy, body, attributes));
	index[name_copy->c_str()] = (int)rules.size()-1;
	return *this;
}

const Rule*
Grammar::lookup(const char* name) const
{
	if (name == 0)
		return 0;

	std::map<const char*, int, NameLess>::const_iterator	found = index.find(name);
	if (found == index.end())
		return 0;
	return &rules[found->second];
}

// Check the literal elements of a rule body, including nested groups
void
Grammar::validate(const char* rule_name, const Sequence& sequence)
{
	for (int i = 0; i < sequence.length(); i++)
	{
		const Element&	element = sequence[i];
		switch (element.type())
		{
		case Element::CharMatch:
			if (!element.is_valid())
				record_error(Error::InvalidLiteral, rule_name);
			break;

		case Element::RangeMatch:
			if (!element.is_valid())
				record_error(Error::InvalidRange, rule_name);
			break;

		case Element::RuleCall:
			if (!element.is_valid())
				record_error(Error::EmptyRuleName, rule_name);
			break;

		case Element::Group:
			for (int a = 0; a < element.alternatives().length(); a++)
				validate(rule_name, element.alternatives()[a]);
			break;
		}
	}
}

void
Grammar::record_error(Error::Type type, const char* rule_name)
{
	if (config_error)
		return;		// Only the first error is kept
	config_error = Error(type, 0, 0, rule_name);
}
