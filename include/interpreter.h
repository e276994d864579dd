#if !defined(INTERPRETER_H)
#define INTERPRETER_H
/*
 * Interpret an input string against a Grammar, starting from a named rule.
 *
 * Matching is recursive descent with backtracking. Every Sequence and every
 * alternative that fails restores the cursor to where it started, so partial
 * matches are never seen by the caller.
 *
 * On failure, the Error reports the furthermost location any attempt reached,
 * with what would have allowed the parse to proceed there. Failures inside a
 * Token rule are not reported individually; the Token rule is reported instead,
 * at the location where it was attempted.
 *
 * Each call to run() keeps its own state, so an Interpreter may be reused, and
 * may run on several threads at once.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstddef>
#include	<sys/types.h>

#include	<grammar.h>
#include	<error.h>

#if !defined(BNF_MAX_DEPTH)
#define	BNF_MAX_DEPTH	1000		// Default limit on the nesting of rule calls
#endif

// One successful alternative of an Alternatives group:
struct	AlternativeMatch
{
	int		alternative;	// Index into the Alternatives
	off_t		length;		// Number of characters matched
};

/*
 * An AlternativePolicy decides which successful alternative is used.
 * A non-exhaustive policy commits to the first success.
 * An exhaustive policy tries every alternative and keeps the one it prefers.
 */
class	AlternativePolicy
{
public:
	virtual		~AlternativePolicy() {}

	virtual bool	exhaustive() const = 0;
	virtual bool	prefer(const AlternativeMatch& candidate, const AlternativeMatch& best) const = 0;
};

// The default: the first alternative that matches is used
class	FirstMatchPolicy
: public AlternativePolicy
{
public:
	virtual bool	exhaustive() const { return false; }
	virtual bool	prefer(const AlternativeMatch& candidate, const AlternativeMatch& best) const { return false; }
};

// The alternative that matches the most characters is used. Ties go to the earlier one.
class	LongestMatchPolicy
: public AlternativePolicy
{
public:
	virtual bool	exhaustive() const { return true; }
	virtual bool	prefer(const AlternativeMatch& candidate, const AlternativeMatch& best) const
			{ return candidate.length > best.length; }
};

class	Interpreter
{
public:
	Interpreter(const Grammar& grammar);	// The grammar is copied, so later changes to it are not seen

	/*
	 * Match the input against start_rule_name.
	 * Return true on success. On failure, return false and set *error (if given).
	 * A badly assembled Grammar is not input the grammar rejects: check error->is_configuration().
	 * If consumed is given, it receives the number of characters the start rule matched.
	 * Names are copied into the Error, so it may outlive start_rule_name and the Interpreter.
	 */
	bool		run(const UTF8* input, const char* start_rule_name, Error* error = 0, off_t* consumed = 0) const;
	bool		run(const UTF8* input, size_t length, const char* start_rule_name, Error* error = 0, off_t* consumed = 0) const;

	const Grammar&	grammar() const { return bound; }

	int		max_depth() const { return depth_limit; }
	void		set_max_depth(int depth) { depth_limit = depth; }

	// When false, the start rule may match only a prefix of the input
	bool		whole_input() const { return require_whole_input; }
	void		set_whole_input(bool whole) { require_whole_input = whole; }

	// The policy is not copied, it must outlive the Interpreter. Null restores the default.
	const AlternativePolicy* policy() const { return alternative_policy; }
	void		set_policy(const AlternativePolicy* policy);

private:
	Grammar		bound;
	int		depth_limit;
	bool		require_whole_input;
	const AlternativePolicy* alternative_policy;

	static	FirstMatchPolicy	first_match;
};

#endif	// INTERPRETER_H
