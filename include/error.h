#if !defined(ERROR_H)
#define	ERROR_H
/*
 * Error numbering system, and the Error returned from grammar construction and interpretation.
 *
 * Each subsystem is statically allocated a 16-bit subsystem "set" number.
 * Each set contains up to 16384 messages indicated by a 14-bit code.
 * The set number 0 corresponds to the system errno, and the msg codes are the errno codes.
 *
 * The interpreter uses two sets. Parse errors are the ordinary result of
 * input that the grammar does not accept. Configuration errors mean the
 * Grammar itself is wrong (an undefined rule, an invalid literal, runaway
 * recursion); these stop a run immediately and are never reported as a parse error.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stdint.h>
#include	<string.h>
#include	<sys/types.h>
#include	<vector>

#include	<refcount.h>
#include	<utf8.h>

#define	BNF_PARSE_ERRSET	0x0B01		// Input not accepted by the grammar
#define	BNF_CONFIG_ERRSET	0x0B02		// Grammar is incorrectly assembled

class ErrNum
{
public:
	static const int32_t	ERR_FLAG = 0x8000000;	// Flag bit is used to indicate an error, allowing quick checks
	static const int32_t	ERR_CUST = 0x4000000;	// Including this bit guarantees no collision with Microsoft subsystem codes

	constexpr ErrNum()
			: errnum(0) {}
	constexpr ErrNum(int set, int msg)
			: errnum(ERR_FLAG | ERR_CUST | ((set & 0xFFFF) << 14) | (msg & 0x3FFF)) {}
	constexpr int	set() const
			{ return (errnum >> 14) & 0xFFFF; }
	constexpr int	msg() const
			{ return errnum & 0x3FFF; }
	bool		operator==(ErrNum x) const
			{ return errnum == x.errnum; }
	bool		operator!=(ErrNum x) const
			{ return errnum != x.errnum; }
	constexpr operator int32_t() const		// Allows use in switch statements
			{ return errnum; }
private:
	int32_t		errnum;
};

/*
 * A counted private copy of a rule name.
 * Grammars and Errors hold these, so no name they report depends on the caller's storage.
 */
class	SharedName
: public RefCounted
{
public:
	SharedName(const char* s)
	: text(new char[strlen(s)+1])
	{ strcpy(text, s); }
	~SharedName() { delete[] text; }

	const char*	c_str() const { return text; }

private:
	char*		text;

	SharedName(const SharedName&);		// Not copyable
	SharedName&	operator=(const SharedName&);
};

/*
 * Something the parser would have accepted at the failure location.
 * While matching, a RuleName points into the Grammar. An Error keeps its own copy.
 */
struct	Expectation
{
	enum Kind { Literal, CharRange, RuleName, EndOfInput };

	Kind		kind;
	UCS4		lo;		// Literal character, or start of a CharRange
	UCS4		hi;		// End of a CharRange
	const char*	name;		// RuleName only

	bool		operator==(const Expectation& e) const
			{ return kind == e.kind && lo == e.lo && hi == e.hi && name == e.name; }

	// Write a readable description into buf (always nul-terminated), return the length written
	int		describe(char* buf, int size) const;
};

/*
 * A returned error has a type (which maps to an ErrNum), a 1-based line and column,
 * perhaps the name of the rule involved, and the expectations at the failure location.
 * An Error is immutable, and copies share the same body.
 * A default-constructed Error means "no error", and tests false.
 */
class	Error
{
	class Body;
public:
	enum Type
	{
		None = 0,

		// Parse errors:
		UnrecognizedExpr,	// A character that nothing in the grammar can accept
		UnexpectedEnd,		// The input ended while more was required
		TrailingInput,		// The start rule matched, but not the entire input

		// Configuration errors:
		UndefinedRule,		// A rule name was referenced but never added
		EmptyRuleName,		// add_rule was given a null or empty name
		InvalidLiteral,		// A Char was not made from exactly one character
		InvalidRange,		// A Range was reversed, or not made from single characters
		LeftRecursion,		// A rule called itself without consuming input
		RecursionLimit		// Rule nesting went deeper than the configured limit
	};

	Error()
			: body(0) {}
	Error(Type type, off_t line, off_t column, const char* subject = 0,
			const Expectation* expected = 0, int num_expected = 0);
	Error(const Error& e)
			: body(e.body) {}
	Error&		operator=(const Error& e)
			{ body = e.body;  return *this; }

	Type		err_type() const
			{ return body ? body->type : None; }
	off_t		err_line() const
			{ return body ? body->line : 0; }
	off_t		err_col() const
			{ return body ? body->column : 0; }
	const char*	subject() const
			{ return body && body->subject ? body->subject->c_str() : 0; }
	int		expectation_count() const
			{ return body ? (int)body->expected.size() : 0; }
	const Expectation&	expectation(int i) const
			{ return body->expected[i]; }

	ErrNum		error_num() const
			{ return body ? errnum(body->type) : ErrNum(); }
	operator ErrNum() const
			{ return error_num(); }
	operator int32_t() const
			{ return (int32_t)error_num(); }

	bool		is_configuration() const
			{ return body && error_num().set() == BNF_CONFIG_ERRSET; }
	bool		is_parse() const
			{ return body && error_num().set() == BNF_PARSE_ERRSET; }

	// Value comparison, of the type and location only
	bool		equals(const Error& other) const
			{
				return err_type() == other.err_type()
					&& err_line() == other.err_line()
					&& err_col() == other.err_col();
			}

	const char*	default_text() const
			{ return default_text(err_type()); }

	// Format a full message into buf (always nul-terminated), return the length written
	int		format(char* buf, int size) const;

	static ErrNum	errnum(Type type);
	static const char* default_text(Type type);
	static const char* type_name(Type type);

private:
	Ref<Body>	body;

	class Body
	: public RefCounted
	{
	public:
		Body(Type t, off_t l, off_t c, const char* s, const Expectation* e, int n);

		const Type	type;
		const off_t	line;
		const off_t	column;
		Ref<SharedName>	subject;
		std::vector<Expectation>	expected;	// RuleName entries point into names
		std::vector<Ref<SharedName> >	names;
	};
};

#define	ERRNUM_UnrecognizedExpr	ErrNum(BNF_PARSE_ERRSET, Error::UnrecognizedExpr)
#define	ERRNUM_UnexpectedEnd	ErrNum(BNF_PARSE_ERRSET, Error::UnexpectedEnd)
#define	ERRNUM_TrailingInput	ErrNum(BNF_PARSE_ERRSET, Error::TrailingInput)
#define	ERRNUM_UndefinedRule	ErrNum(BNF_CONFIG_ERRSET, Error::UndefinedRule)
#define	ERRNUM_EmptyRuleName	ErrNum(BNF_CONFIG_ERRSET, Error::EmptyRuleName)
#define	ERRNUM_InvalidLiteral	ErrNum(BNF_CONFIG_ERRSET, Error::InvalidLiteral)
#define	ERRNUM_InvalidRange	ErrNum(BNF_CONFIG_ERRSET, Error::InvalidRange)
#define	ERRNUM_LeftRecursion	ErrNum(BNF_CONFIG_ERRSET, Error::LeftRecursion)
#define	ERRNUM_RecursionLimit	ErrNum(BNF_CONFIG_ERRSET, Error::RecursionLimit)

#endif	// ERROR_H
