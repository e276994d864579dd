/*
 * Error construction, numbering and message formatting
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstdio>
#include	<cstring>

#include	<error.h>

Error::Error(Type type, off_t line, off_t column, const char* subject, const Expectation* expected, int num_expected)
: body(new Body(type, line, column, subject, expected, num_expected))
{
}

// Copy the subject and the expected rule names, so the Error outlives the Grammar and the caller's strings
Error::Body::Body(Type t, off_t l, off_t c, const char* s, const Expectation* e, int n)
: type(t)
, line(l)
, column(c)
, subject(s ? new SharedName(s) : 0)
, expected(e, e+n)
{
	for (size_t i = 0; i < expected.size(); i++)
	{
		if (!expected[i].name)
			continue;
		names.push_back(Ref<SharedName>(new SharedName(expected[i].name)));
		expected[i].name = names.back()->c_str();
	}
}

ErrNum
Error::errnum(Type type)
{
	switch (type)
	{
	case None:
		return ErrNum();

	case UnrecognizedExpr:
	case UnexpectedEnd:
	case TrailingInput:
		return ErrNum(BNF_PARSE_ERRSET, type);

	default:
		return ErrNum(BNF_CONFIG_ERRSET, type);
	}
}

const char*
Error::type_name(Type type)
{
	switch (type)
	{
	case None:		return "None";
	case UnrecognizedExpr:	return "UnrecognizedExpr";
	case UnexpectedEnd:	return "UnexpectedEnd";
	case TrailingInput:	return "TrailingInput";
	case UndefinedRule:	return "UndefinedRule";
	case EmptyRuleName:	return "EmptyRuleName";
	case InvalidLiteral:	return "InvalidLiteral";
	case InvalidRange:	return "InvalidRange";
	case LeftRecursion:	return "LeftRecursion";
	case RecursionLimit:	return "RecursionLimit";
	}
	return "Unknown";
}

// Default message text. A %s is replaced by the subject rule name.
const char*
Error::default_text(Type type)
{
	switch (type)
	{
	case None:		return "no error";
	case UnrecognizedExpr:	return "unrecognized expression";
	case UnexpectedEnd:	return "unexpected end of input";
	case TrailingInput:	return "`%s` matched, but unrecognized input follows";
	case UndefinedRule:	return "rule `%s` is not defined";
	case EmptyRuleName:	return "a rule was added with no name";
	case InvalidLiteral:	return "rule `%s` has a literal that is not exactly one character";
	case InvalidRange:	return "rule `%s` has an invalid character range";
	case LeftRecursion:	return "rule `%s` is left-recursive";
	case RecursionLimit:	return "rule nesting exceeded the limit in `%s`";
	}
	return "unknown error";
}

// Describe a character the way it would be written in a grammar
static int
describe_char(char* buf, int size, UCS4 ch)
{
	const char*	escape = 0;
	switch (ch)
	{
	case '\n':	escape = "\\n"; break;
	case '\r':	escape = "\\r"; break;
	case '\t':	escape = "\\t"; break;
	case '\'':	escape = "\\'"; break;
	case '\\':	escape = "\\\\"; break;
	}
	if (escape)
		return snprintf(buf, size, "'%s'", escape);
	if (ch < ' ' || !UCS4IsUnicode(ch))
		return snprintf(buf, size, "'\\u{%X}'", (unsigned)ch);

	UTF8	utf8[5];
	UTF8*	up = utf8;
	UTF8Put(up, ch);
	*up = '\0';
	return snprintf(buf, size, "'%s'", utf8);
}

int
Expectation::describe(char* buf, int size) const
{
	if (size <= 0)
		return 0;
	*buf = '\0';

	int	len = 0;
	switch (kind)
	{
	case Literal:
		len = describe_char(buf, size, lo);
		break;

	case CharRange:
		len = snprintf(buf, size, "[");
		if (len < size)
			len += describe_char(buf+len, size-len, lo);
		if (len < size)
			len += snprintf(buf+len, size-len, "-");
		if (len < size)
			len += describe_char(buf+len, size-len, hi);
		if (len < size)
			len += snprintf(buf+len, size-len, "]");
		break;

	case RuleName:
		len = snprintf(buf, size, "%s", name ? name : "?");
		break;

	case EndOfInput:
		len = snprintf(buf, size, "end of input");
		break;
	}
	return len < size ? len : size-1;
}

int
Error::format(char* buf, int size) const
{
	if (size <= 0)
		return 0;
	*buf = '\0';

	int	len = snprintf(buf, size, "line %ld, column %ld: ", (long)err_line(), (long)err_col());
	if (len < size)
	{
		const char*	subj = subject();
		len += snprintf(buf+len, size-len, default_text(), subj ? subj : "?");
	}

	for (int i = 0; i < expectation_count() && len < size; i++)
	{
		len += snprintf(buf+len, size-len, "%s", i == 0 ? ", expected " : ", ");
		if (i == 0 && expectation_count() > 1 && len < size)
			len += snprintf(buf+len, size-len, "one of: ");
		if (len < size)
			len += expectation(i).describe(buf+len, size-len);
	}
	return len < size ? len : size-1;
}
