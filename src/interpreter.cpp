/*
 * Recursive descent interpretation of a Grammar
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstdio>
#include	<cstring>
#include	<vector>

#include	<interpreter.h>
#include	<bnf_source.h>

FirstMatchPolicy	Interpreter::first_match;

/*
 * Each time a Rule calls a subordinate Rule, a new Context is created.
 * The Contexts form a linked list back to the start rule, for tracing and left-recursion purposes.
 */
class	InterpreterContext
{
public:
	InterpreterContext(InterpreterContext* _parent, const Rule* _rule, BnfSource _origin)
	: parent(_parent)
	, rule(_rule)
	, origin(_origin)
	, depth(_parent ? _parent->depth+1 : 1)
	, token_nesting((_parent ? _parent->token_nesting : 0) + (_rule->is_token() ? 1 : 0))
	{}

	void		print_path() const
			{
				if (parent)
				{
					parent->print_path();
					printf("->");
				}
				else
					printf("@depth=%d: ", depth);
				printf("%s", rule->name);
			}

	InterpreterContext* parent;	// Context of the calling rule
	const Rule*	rule;		// The Rule this context applies to
	BnfSource	origin;		// Location where this rule started, for detection of left-recursion
	int		depth;		// Number of rule calls in the path, including this one
	int		token_nesting;	// Number of Token rules in the path. Failures inside a Token are not recorded
};

/*
 * The state of a single run: where the parse got to, why it could get no further,
 * and any configuration error that stopped it.
 */
class	InterpreterRun
{
public:
	InterpreterRun(const Grammar& _grammar, const AlternativePolicy* _policy, int _max_depth)
	: grammar(_grammar)
	, policy(_policy)
	, max_depth(_max_depth)
	, furthermost()
	, recorded(false)
	{}

	bool		match_rule(const Rule* rule, BnfSource& source, InterpreterContext* caller);

	// Build the parse error after the start rule failed, or matched only to end:
	Error		parse_error(const Rule* start_rule, bool matched, const BnfSource& start, const BnfSource& end);

	Error		fatal;		// A configuration error stops everything

protected:
	const Grammar&	grammar;
	const AlternativePolicy* policy;
	int		max_depth;

	// The furthermost location where an element failed, and what was expected there:
	BnfSource	furthermost;
	bool		recorded;
	std::vector<Expectation>	expectations;

	bool		match_sequence(const Sequence& sequence, BnfSource& source, InterpreterContext* context);
	bool		match_element(const Element& element, BnfSource& source, InterpreterContext* context);
	bool		match_alternatives(const Alternatives& alternatives, BnfSource& source, InterpreterContext* context);

	void		record_failure(const Expectation& expected, const BnfSource& location, InterpreterContext* context);
	void		fail_fatally(Error::Type type, const char* subject, const BnfSource& location);
};

bool
InterpreterRun::match_rule(const Rule* rule, BnfSource& source, InterpreterContext* caller)
{
	if (fatal)
		return false;

	// Check for left recursion (infinite loop)
	for (InterpreterContext* pp = caller; pp; pp = pp->parent)
	{
		if (pp->origin < source)
			break;	// This rule is starting ahead of pp and all its ancestors
		if (pp->rule == rule)
		{
#if defined(BNF_TRACE)
			caller->print_path();
			printf(": left recursion into %s detected at `%.*s`\n", rule->name, source.peek_length(10), source.peek());
#endif
			fail_fatally(Error::LeftRecursion, rule->name, source);
			return false;
		}
	}

	if ((caller ? caller->depth+1 : 1) > max_depth)
	{
		fail_fatally(Error::RecursionLimit, rule->name, source);
		return false;
	}

	InterpreterContext	context(caller, rule, source);
	BnfSource		start(source);

#if defined(BNF_TRACE)
	context.print_path();
	printf(": calling %s at `%.*s...`\n", rule->name, source.peek_length(10), source.peek());
#endif

	bool	ok = match_sequence(rule->body, source, &context);
	if (!ok)
	{
#if defined(BNF_TRACE)
		printf("FAIL %s\n", rule->name);
#endif
		source = start;
		if (rule->is_token() && !fatal)
		{		// A Token is reported as a whole, where it started
			Expectation	e = { Expectation::RuleName, UCS4_NONE, UCS4_NONE, rule->name };
			record_failure(e, start, caller);
		}
		return false;
	}

#if defined(BNF_TRACE)
	printf("MATCH %s `%.*s`\n", rule->name, (int)(source.current_byte()-start.current_byte()), start.peek());
#endif
	return true;
}

bool
InterpreterRun::match_sequence(const Sequence& sequence, BnfSource& source, InterpreterContext* context)
{
	BnfSource	start(source);		// Save for a failure exit

	for (int i = 0; i < sequence.length(); i++)
		if (!match_element(sequence[i], source, context))
		{
			source = start;
			return false;
		}
	return true;
}

bool
InterpreterRun::match_element(const Element& element, BnfSource& source, InterpreterContext* context)
{
	switch (element.type())
	{
	case Element::CharMatch:
	case Element::RangeMatch:
		if (element.matches(source.peek_char()))	// At EOF, UCS4_NONE matches nothing
		{
			(void)source.get_char();
			return true;
		}
		record_failure(element.expectation(), source, context);
		return false;

	case Element::RuleCall:
		{
		const Rule*	sub_rule = grammar.lookup(element.rule_name());
		if (!sub_rule)
		{
#if defined(BNF_TRACE)
			printf("failed to find rule `%s`\n", element.rule_name());
#endif
			fail_fatally(Error::UndefinedRule, element.rule_name(), source);
			return false;
		}
		return match_rule(sub_rule, source, context);
		}

	case Element::Group:
		return match_alternatives(element.alternatives(), source, context);
	}
	return false;
}

bool
InterpreterRun::match_alternatives(const Alternatives& alternatives, BnfSource& source, InterpreterContext* context)
{
	BnfSource	start(source);
	BnfSource	best_end;
	AlternativeMatch best = { -1, 0 };

	for (int i = 0; i < alternatives.length() && !fatal; i++)
	{
		BnfSource	attempt(start);
		if (!match_sequence(alternatives[i], attempt, context))
			continue;

		AlternativeMatch candidate = { i, attempt - start };
		if (best.alternative < 0 || policy->prefer(candidate, best))
		{
			best = candidate;
			best_end = attempt;
		}
		if (!policy->exhaustive())
			break;
	}

	if (best.alternative < 0 || fatal)
	{
		source = start;
		return false;
	}
	source = best_end;
	return true;
}

void
InterpreterRun::record_failure(const Expectation& expected, const BnfSource& location, InterpreterContext* context)
{
	if (context && context->token_nesting > 0)
		return;		// The enclosing Token will be reported instead

	if (recorded && location < furthermost)
		return;		// We got further previously

	if (!recorded || furthermost < location)
	{		// We got further this time, previous failures don't matter
		expectations.clear();
		furthermost = location;
		recorded = true;
	}

	// Don't double-up failures of the same expectation at the same location:
	for (size_t i = 0; i < expectations.size(); i++)
		if (expectations[i] == expected)
			return;
	expectations.push_back(expected);
}

void
InterpreterRun::fail_fatally(Error::Type type, const char* subject, const BnfSource& location)
{
	if (fatal)
		return;
	fatal = Error(type, location.current_line(), location.current_column(), subject);
}

Error
InterpreterRun::parse_error(const Rule* start_rule, bool matched, const BnfSource& start, const BnfSource& end)
{
	if (matched && (!recorded || !(end < furthermost)))
	{		// Nothing got further than the end of the start rule
		const Expectation*	expected = 0;
		int			num_expected = 0;
		if (recorded && furthermost.same(end))
		{
			expected = expectations.data();
			num_expected = (int)expectations.size();
		}
		return Error(Error::TrailingInput, end.current_line(), end.current_column(),
			start_rule->name, expected, num_expected);
	}

	const BnfSource&	location = recorded ? furthermost : start;
	return Error(
		location.at_eof() ? Error::UnexpectedEnd : Error::UnrecognizedExpr,
		location.current_line(),
		location.current_column(),
		start_rule->name,
		expectations.data(),
		(int)expectations.size()
	);
}

Interpreter::Interpreter(const Grammar& grammar)
: bound(grammar)
, depth_limit(BNF_MAX_DEPTH)
, require_whole_input(true)
, alternative_policy(&first_match)
{
}

void
Interpreter::set_policy(const AlternativePolicy* policy)
{
	alternative_policy = policy ? policy : &first_match;
}

bool
Interpreter::run(const UTF8* input, const char* start_rule_name, Error* error, off_t* consumed) const
{
	return run(input, input ? strlen(input) : 0, start_rule_name, error, consumed);
}

bool
Interpreter::run(const UTF8* input, size_t length, const char* start_rule_name, Error* error, off_t* consumed) const
{
	Error		result;
	BnfSource	start(input, input ? input+length : 0);
	BnfSource	source(start);

	if (consumed)
		*consumed = 0;

	const Rule*	start_rule = bound.lookup(start_rule_name);
	if (bound.error())
	{		// The grammar was not correctly assembled. Report it at the start of the input
		Error	config = bound.error();
		result = Error(config.err_type(), 1, 1, config.subject());
	}
	else if (!start_rule)
		result = Error(Error::UndefinedRule, 1, 1, start_rule_name);
	else
	{
#if defined(BNF_TRACE)
		printf("Starting %s at `%.*s...`\n", start_rule->name, start.peek_length(10), start.peek());
#endif
		InterpreterRun	matcher(bound, alternative_policy, depth_limit);
		bool		matched = matcher.match_rule(start_rule, source, 0);

		if (matcher.fatal)
			result = matcher.fatal;
		else
		{
			if (matched && consumed)
				*consumed = source - start;
			if (!matched || (require_whole_input && !source.at_eof()))
				result = matcher.parse_error(start_rule, matched, start, source);
		}
	}

	if (error)
		*error = result;
	return !result;
}
