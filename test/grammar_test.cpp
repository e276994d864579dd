/*
 * Test program for Grammar construction, and for Errors.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstdio>
#include	<cstring>
#include	<grammar.h>
#include	<error.h>

bool		show_passes = false;
int		test_count;
int		failure_count;
const char*	new_group;

void		grammar_elements();
void		grammar_chaining();
void		grammar_overwrite();
void		grammar_forward_reference();
void		grammar_owned_names();
void		grammar_config_errors();
void		error_values();
void		error_format();

int
main(int argc, const char** argv)
{
	if (argc > 1 && 0 == strcmp("-p", argv[1]))
		show_passes = true;

	grammar_elements();
	grammar_chaining();
	grammar_overwrite();
	grammar_forward_reference();
	grammar_owned_names();
	grammar_config_errors();
	error_values();
	error_format();

	printf("Completed %d tests with %d failures\n", test_count, failure_count);
	return failure_count == 0 ? 0 : 1;
}

void
test_group(const char* group)
{
	new_group = group;
}

void
expect(const char* when, long result, long wanted = 1)
{
	test_count++;
	if (result != wanted)
	{
		if (new_group)
			printf("%s:\n", new_group);
		if (wanted != 1)
			printf("%d:\t%s: FAIL (wanted %ld got %ld)\n", test_count, when, wanted, result);
		else
			printf("%d:\t%s: FAIL\n", test_count, when);
		failure_count++;
		new_group = 0;
	}
	else if (show_passes)
	{
		if (new_group)
			printf("%s:\n", new_group);
		printf("%d:\t%s: PASS\n", test_count, when);
		new_group = 0;
	}
}

void
expect_text(const char* when, const char* result, const char* wanted)
{
	bool	same = result && wanted ? 0 == strcmp(result, wanted) : result == wanted;
	expect(when, same);
	if (!same)
		printf("\twanted \"%s\"\n\tgot    \"%s\"\n", wanted ? wanted : "(null)", result ? result : "(null)");
}

void
grammar_elements()
{
	test_group("elements");

	Sequence	s{
		Char('('),
		Range("A", "Z"),
		"statement",
		Alternatives{Sequence{Char('&')}, Sequence{Char("\xE2\x88\xA8")}},
		Sequence{Char(')')}
	};
	expect("length", s.length(), 5);
	expect("char type", s[0].type(), Element::CharMatch);
	expect("range type", s[1].type(), Element::RangeMatch);
	expect("call type", s[2].type(), Element::RuleCall);
	expect("alternatives type", s[3].type(), Element::Group);
	expect("nested sequence type", s[4].type(), Element::Group);
	expect_text("call name", s[2].rule_name(), "statement");
	expect("two alternatives", s[3].alternatives().length(), 2);
	expect("nested sequence is one alternative", s[4].alternatives().length(), 1);

	expect("char matches", s[0].matches('('));
	expect("char rejects", !s[0].matches(')'));
	expect("range low bound", s[1].matches('A'));
	expect("range high bound", s[1].matches('Z'));
	expect("range rejects above", !s[1].matches('['));
	expect("range rejects below", !s[1].matches('@'));
	expect("multibyte literal", s[3].alternatives()[1][0].matches(0x2228));

	Element	copy = s[3];
	expect("copy shares the group", &copy.alternatives() == &s[3].alternatives());

	expect("default attributes", !Attributes().is_token());
	expect("token attributes", Attributes(Attributes::Token).is_token());

	expect("valid char", Char("\xE2\x82\x81").is_valid());
	expect("two chars is invalid", !Char("ab").is_valid());
	expect("empty is invalid", !Char("").is_valid());
	expect("reversed range is invalid", !Range('Z', 'A').is_valid());
	expect("single char range is valid", Range('Q', 'Q').is_valid());
}

void
grammar_chaining()
{
	test_group("add_rule chaining and order");

	Grammar		g;
	Grammar&	chained = g
		.add_rule("first", Sequence{Char('1')})
		.add_rule("second", Sequence{Char('2')}, Attributes(Attributes::Token))
		.add_rule("third", Sequence{"first", "second"});

	expect("returns the same grammar", &chained == &g);
	expect("rule count", g.rule_count(), 3);
	expect_text("insertion order 0", g.rule(0).name, "first");
	expect_text("insertion order 1", g.rule(1).name, "second");
	expect_text("insertion order 2", g.rule(2).name, "third");
	expect("token attribute kept", g.lookup("second")->is_token());
	expect("structural attribute kept", !g.lookup("third")->is_token());
	expect("no error", !g.error());

	// Lookup is by name, not by pointer:
	char	name[] = "second";
	expect("lookup by content", g.lookup(name) == &g.rule(1));
	expect("lookup missing", g.lookup("fourth") == 0);
	expect("lookup null", g.lookup(0) == 0);
}

void
grammar_overwrite()
{
	test_group("overwriting a rule");

	Grammar	g;
	g.add_rule("a", Sequence{Char('a')})
	 .add_rule("b", Sequence{Char('b')})
	 .add_rule("a", Sequence{Char('x'), Char('y')}, Attributes(Attributes::Token));

	expect("count unchanged", g.rule_count(), 2);
	expect_text("position kept", g.rule(0).name, "a");
	expect("body replaced", g.lookup("a")->body.length(), 2);
	expect("attributes replaced", g.lookup("a")->is_token());
	expect("other rule untouched", g.lookup("b")->body.length(), 1);
}

void
grammar_forward_reference()
{
	test_group("forward references");

	Grammar	g;
	g.add_rule("statement", Sequence{"letter", "digit"});
	expect("referenced rule not yet defined", g.lookup("letter") == 0);
	expect("forward reference is not an error", !g.error());

	g.add_rule("letter", Sequence{Range('A', 'Z')})
	 .add_rule("digit", Sequence{Range('0', '9')});
	expect("defined later", g.lookup("letter") != 0);
	expect("defined after", g.lookup("digit") != 0);
}

void
grammar_owned_names()
{
	test_group("names are copied");

	char*	name = new char[8];
	char*	call = new char[8];
	strcpy(name, "first");
	strcpy(call, "second");

	Grammar	g;
	g.add_rule(name, Sequence{call})
	 .add_rule("second", Sequence{Char('2')});
	Sequence	body{call};
	strcpy(name, "other");
	strcpy(call, "other");

	expect("lookup by the original name", g.lookup("first") != 0);
	expect("not by the changed text", g.lookup("other") == 0);
	expect_text("rule keeps its name", g.rule(0).name, "first");
	expect_text("call keeps its name", g.rule(0).body[0].rule_name(), "second");
	expect_text("element keeps its name", body[0].rule_name(), "second");

	g.add_rule(name, Sequence{Char('o')});
	delete[] name;
	delete[] call;
	expect("added after a change", g.rule_count(), 3);
	expect_text("third rule name", g.rule(2).name, "other");

	Grammar	copy = g;
	g.add_rule("first", Sequence{Char('1')});
	expect("copy lookup", copy.lookup("first") != 0);
	expect("copy keeps its body", copy.lookup("first")->body[0].type(), Element::RuleCall);
	expect("original overwritten", g.lookup("first")->body[0].type(), Element::CharMatch);

	Expectation	expected = { Expectation::RuleName, UCS4_NONE, UCS4_NONE, 0 };
	char*		expected_name = new char[8];
	strcpy(expected_name, "digit");
	expected.name = expected_name;
	Error		e(Error::UnexpectedEnd, 1, 2, expected_name, &expected, 1);
	delete[] expected_name;
	expect_text("error keeps its subject", e.subject(), "digit");
	expect_text("error keeps its expectation", e.expectation(0).name, "digit");
}

void
grammar_config_errors()
{
	test_group("configuration errors");

	Grammar	empty_name;
	empty_name.add_rule("", Sequence{Char('a')});
	expect("empty name", empty_name.error().err_type(), Error::EmptyRuleName);
	expect("empty name not added", empty_name.rule_count(), 0);
	expect("is configuration", empty_name.error().is_configuration());

	Grammar	null_name;
	null_name.add_rule(0, Sequence{Char('a')});
	expect("null name", null_name.error().err_type(), Error::EmptyRuleName);

	Grammar	bad_literal;
	bad_literal.add_rule("ok", Sequence{Char('a')})
		.add_rule("arrow", Sequence{Char("->")});
	expect("invalid literal", bad_literal.error().err_type(), Error::InvalidLiteral);
	expect_text("invalid literal rule", bad_literal.error().subject(), "arrow");
	expect("invalid literal rule still added", bad_literal.rule_count(), 2);

	Grammar	bad_range;
	bad_range.add_rule("digits", Sequence{Alternatives{Sequence{Char('+')}, Sequence{Range('9', '0')}}});
	expect("invalid nested range", bad_range.error().err_type(), Error::InvalidRange);
	expect_text("invalid range rule", bad_range.error().subject(), "digits");

	Grammar	first_kept;
	first_kept.add_rule("one", Sequence{Range("", "z")})
		.add_rule("two", Sequence{Char("")});
	expect("first error kept", first_kept.error().err_type(), Error::InvalidRange);
	expect_text("first error rule", first_kept.error().subject(), "one");

	Grammar	bad_call;
	bad_call.add_rule("caller", Sequence{""});
	expect("empty call name", bad_call.error().err_type(), Error::EmptyRuleName);
}

void
error_values()
{
	test_group("error values");

	Error	none;
	expect("null error is false", !none);
	expect("null error type", none.err_type(), Error::None);
	expect("null error is neither", !none.is_parse() && !none.is_configuration());

	Error	e(Error::UnrecognizedExpr, 1, 3, "statement");
	expect("error is true", e ? 1 : 0);
	expect("type", e.err_type(), Error::UnrecognizedExpr);
	expect("line", e.err_line(), 1);
	expect("column", e.err_col(), 3);
	expect("is parse", e.is_parse());
	expect("integer comparison", e == ERRNUM_UnrecognizedExpr);
	expect("errnum set", e.error_num().set(), BNF_PARSE_ERRSET);
	expect("errnum msg", e.error_num().msg(), Error::UnrecognizedExpr);

	switch (e)
	{
	case ERRNUM_UnrecognizedExpr:
		expect("switch on errnum", 1);
		break;
	default:
		expect("switch on errnum", 0);
		break;
	}

	Error	same(Error::UnrecognizedExpr, 1, 3);
	Error	moved(Error::UnrecognizedExpr, 1, 4);
	Error	other(Error::UnexpectedEnd, 1, 3);
	expect("equal by value", e.equals(same));
	expect("different column", !e.equals(moved));
	expect("different type", !e.equals(other));

	Error	copy = e;
	expect("copy is equal", copy.equals(e));
	expect_text("copy keeps subject", copy.subject(), "statement");

	Error	config(Error::UndefinedRule, 2, 1, "missing");
	expect("config set", config.error_num().set(), BNF_CONFIG_ERRSET);
	expect("is configuration", config.is_configuration());
	expect("config is not parse", !config.is_parse());
	expect_text("type name", Error::type_name(Error::LeftRecursion), "LeftRecursion");
}

void
error_format()
{
	test_group("error messages");

	char		buf[200];
	Expectation	expected[] = {
		{ Expectation::RuleName, UCS4_NONE, UCS4_NONE, "grouper-opening" },
		{ Expectation::Literal, '~', '~', 0 },
		{ Expectation::CharRange, 'A', 'Z', 0 },
		{ Expectation::Literal, 0x2283, 0x2283, 0 }
	};

	Error	e(Error::UnrecognizedExpr, 1, 3, "statement", expected, 4);
	expect("expectation count", e.expectation_count(), 4);
	expect("expectation kept", e.expectation(1).lo, '~');
	e.format(buf, sizeof(buf));
	expect_text("parse message", buf,
		"line 1, column 3: unrecognized expression, expected one of: grouper-opening, '~', ['A'-'Z'], '\xE2\x8A\x83'");

	Error	one(Error::UnexpectedEnd, 2, 7, "statement", expected, 1);
	one.format(buf, sizeof(buf));
	expect_text("single expectation", buf, "line 2, column 7: unexpected end of input, expected grouper-opening");

	Error	undefined(Error::UndefinedRule, 1, 1, "missing");
	undefined.format(buf, sizeof(buf));
	expect_text("subject message", buf, "line 1, column 1: rule `missing` is not defined");

	Expectation	newline = { Expectation::Literal, '\n', '\n', 0 };
	newline.describe(buf, sizeof(buf));
	expect_text("escaped newline", buf, "'\\n'");

	Expectation	eoi = { Expectation::EndOfInput, UCS4_NONE, UCS4_NONE, 0 };
	eoi.describe(buf, sizeof(buf));
	expect_text("end of input", buf, "end of input");

	char	small[10];
	int	len = e.format(small, sizeof(small));
	expect("truncated length", len, 9);
	expect("truncated is terminated", strlen(small), 9);
}
