#if !defined(BNF_SOURCE_H)
#define BNF_SOURCE_H
/*
 * The input cursor used by the grammar Interpreter.
 *
 * A BnfSource represents a location in a UTF-8 byte stream, and only moves forwards.
 * A BnfSource may be copied. Each copy will re-read the same data as it moves forward.
 * This is how the Interpreter backtracks: it saves a copy and assigns it back.
 *
 * Besides the data pointer, a BnfSource counts:
 * - char_count		Number of characters (code points) since the start of the input
 * - byte_count		Number of bytes since the start of the input
 * - line_count		Line number of the current location (starts from 1, increases each \n)
 * - column_char	Character number since the start of the current line (starts from 1)
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstring>
#include	<sys/types.h>

#include	<utf8.h>

class	BnfSource
{
public:
	using Char = UCS4;

	// A null Source, used during initialisation:
	BnfSource()
	: data(0)
	, end(0)
	, char_count(0)
	, byte_count(0)
	, line_count(1)
	, column_char(1)
	{ }
	bool		is_null() const { return data == 0; }

	// A valid Source, starting at the beginning of the input. If no end is given, the input is nul-terminated.
	BnfSource(const UTF8* cp, const UTF8* _end = 0)
	: data(cp)
	, end(_end ? _end : (cp ? cp+strlen(cp) : 0))
	, char_count(0)
	, byte_count(0)
	, line_count(1)
	, column_char(1)
	{ }

	// Copy constructor. A copy does not advance when the origin advances
	BnfSource(const BnfSource& pi)
	: data(pi.data)
	, end(pi.end)
	, char_count(pi.char_count)
	, byte_count(pi.byte_count)
	, line_count(pi.line_count)
	, column_char(pi.column_char)
	{ }
	BnfSource&	operator=(const BnfSource& pi)
			{
				data = pi.data;
				end = pi.end;
				char_count = pi.char_count;
				byte_count = pi.byte_count;
				line_count = pi.line_count;
				column_char = pi.column_char;
				return *this;
			}

	bool		at_eof() const
			{ return data == 0 || data >= end; }

	// The character under the cursor, without advancing
	Char		peek_char() const
			{
				if (at_eof()) return UCS4_NONE;
				const UTF8*	cp = data;
				return UTF8Get(cp, end);
			}

	// Return the next character and advance past it
	Char		get_char()
			{
				if (at_eof()) return UCS4_NONE;
				const UTF8*	start = data;
				Char	c = UTF8Get(data, end);
				byte_count += data-start;
				char_count++;
				bump_counts(c);
				return c;
			}

	bool		same(const BnfSource& other) const
			{ return data == other.data; }
	bool		operator<(const BnfSource& other) const
			{ return data < other.data; }
	off_t		operator-(const BnfSource& other) const	// Distance in characters
			{ return char_count - other.char_count; }

	// The remaining data, never null, and how many bytes of it (up to limit) may be read:
	const UTF8*	peek() const { return data ? data : ""; }
	int		peek_length(int limit) const
			{ return at_eof() ? 0 : (end-data < limit ? (int)(end-data) : limit); }
	off_t		current_char() const { return char_count; }
	off_t		current_byte() const { return byte_count; }
	off_t		current_line() const { return line_count; }
	off_t		current_column() const { return column_char; }	// In Chars

protected:
	const UTF8*	data;		// Pointer to the next byte of data
	const UTF8*	end;		// Pointer past the last byte of data
	off_t		char_count;	// Total characters traversed
	off_t		byte_count;	// Total bytes traversed
	off_t		line_count;	// Incremented from 1 after each \n
	off_t		column_char;	// Reset to one after \n, incremented on get_char

	void		bump_counts(Char c)
			{
				if (c == '\n')
				{
					line_count++;
					column_char = 1;
				}
				else
					column_char++;
			}
};

#endif	// BNF_SOURCE_H
