#if !defined(UTF8_H)
#define UTF8_H
/*
 * UTF-8 decode/encode for the grammar interpreter.
 *
 * Grammars and their inputs are matched in whole UCS4 characters (code points),
 * never in bytes, so that a Range compares multi-byte characters correctly.
 *
 * A UTF8 character is represented as 1-4 bytes.
 * A first byte with a most significant bit of zero is a single ASCII byte.
 * The bytes after the first always have most significant two bits == "10",
 * which never occurs in the first byte.
 *
 * Illegal UTF-8 handling:
 * A byte which does not start a legal sequence is returned as a 32-bit value
 * with the high order bit set, as in, 0x800000yy, and only that byte is consumed.
 * These values lie far above the Unicode range, so no Char or Range can match them.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstdint>

typedef char		UTF8;		// We don't assume un/signed
typedef	char32_t	UCS4;		// A UCS4 character, aka UTF-32, aka Rune

#define	UCS4_NONE	((UCS4)0xFFFFFFFF)	// Marker indicating no UCS4 character
#define	UCS4_MAX	((UCS4)0x0010FFFF)	// Largest Unicode scalar value

inline bool	UCS4IsUnicode(UCS4 ch) { return ch <= UCS4_MAX; }

inline bool
UCS4IsIllegal(UCS4 ucs4)	// Does this UCS4 character encode an illegal utf-8 byte?
{
	return (ucs4 & 0xFFFFFF00) == 0x80000000 || ucs4 == UCS4_NONE;
}

inline UCS4
UTF8EncodeIllegal(UTF8 illegal)	// Encode an illegal UTF8 byte as a UCS4 replacement
{
	return 0x80000000 | (illegal&0xFF);
}

inline bool
UTF8Is1st(UTF8 ch)
{
	return (ch & 0xC0) != 0x80;	// A non-1st byte is always 0b10xx_xxxx
}

// Get length of UTF8 from UCS4, zero if it has no encoding
inline int
UTF8Len(UCS4 ch)
{
	if (ch < (1<<7))	// 7 bits:
		return 1;	// ASCII
	if (ch < (1<<11))	// 11 bits:
		return 2;	// two bytes
	if (ch < (1<<16))	// 16 bits
		return 3;	// three bytes
	if (ch <= UCS4_MAX)	// 21 bits, but Unicode stops here
		return 4;	// four bytes
	if (UCS4IsIllegal(ch))
		return 1;	// The original byte
	return 0;
}

// From a candidate UTF8 first byte, return the length of the UTF8 sequence it introduces:
inline int
UTF8CorrectLen(UTF8 c)
{
	if ((unsigned char)c < 0x80) return 1;		// 0b0xxx_xxxx
	if ((unsigned char)c < 0xC0) return 0;		// 0b10xx_xxxx, not a valid 1st byte
	if ((unsigned char)c < 0xE0) return 2;		// 0b110x_xxxx
	if ((unsigned char)c < 0xF0) return 3;		// 0b1110_xxxx
	if ((unsigned char)c < 0xF8) return 4;		// 0b1111_0xxx
	return 0;					// 5 and 6 byte forms are not Unicode
}

/*
 * Get the next character and advance cp past it.
 * If end is given, no byte at or after end is read; a sequence truncated by end
 * is illegal, and its first byte is returned as an illegal character.
 */
inline UCS4
UTF8Get(const UTF8*& cp, const UTF8* end = 0)
{
	const	UTF8*	sp = cp;
	static	unsigned char	masks[] = { 0xFF, 0x7F, 0x1F, 0x0F, 0x07 };

	int		len = UTF8CorrectLen(*cp);
	UCS4		ch = *cp & masks[len];

	if (len == 0 || (end && end-cp < len))
		goto illegal;

	switch (len)
	{
	case 4:	cp++;
		if (UTF8Is1st(*cp)) goto illegal;
		ch = (ch << 6) | (*cp&0x3F);
		// Fall through
	case 3:	cp++;
		if (UTF8Is1st(*cp)) goto illegal;
		ch = (ch << 6) | (*cp&0x3F);
		// Fall through
	case 2:	cp++;
		if (UTF8Is1st(*cp)) goto illegal;
		ch = (ch << 6) | (*cp&0x3F);
		// Fall through
	case 1:	cp++;
		if (len > 1 && UTF8Len(ch) != len)
			goto illegal;	// Overlong encoding
		if (!UCS4IsUnicode(ch))
			goto illegal;
		return ch;
	}

illegal:
	cp = sp+1;
	return UTF8EncodeIllegal(*sp);
}

// Store UTF8 from UCS4. Characters with no encoding are not stored.
inline void
UTF8Put(UTF8*& cp, UCS4 ch)
{
	switch (UTF8Len(ch))
	{
	default:
		return;

	case 1:			// Single byte
		*cp++ = (UTF8)ch;	// If UCS4IsIllegal(ch) this restores the original byte
		return;

	case 2:		// 5 data bits in 1st byte, 6 in next
		*cp++ = 0xC0 | (UTF8)((ch >>  6) & 0x1F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;

	case 3:		// 4 data bits in 1st byte, 6 in each of 2 more
		*cp++ = 0xE0 | (UTF8)((ch >> 12) & 0x0F);
		*cp++ = 0x80 | (UTF8)((ch >>  6) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;

	case 4:		// 3 data bits in 1st byte, 6 in each of 3 more
		*cp++ = 0xF0 | (UTF8)((ch >> 18) & 0x07);
		*cp++ = 0x80 | (UTF8)((ch >> 12) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  6) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;
	}
}

/*
 * If the nul-terminated string s holds exactly one character, return it.
 * Otherwise (empty, illegal, or more than one character) return UCS4_NONE.
 */
inline UCS4
UTF8Single(const UTF8* s)
{
	if (s == 0 || *s == '\0')
		return UCS4_NONE;
	UCS4	ch = UTF8Get(s);
	if (UCS4IsIllegal(ch) || *s != '\0')
		return UCS4_NONE;
	return ch;
}

#endif	// UTF8_H
