/* This file is part of gifanim.
**
** Copyright 2015-2019 - Marisa Heit
**
** gifanim is free software : you can redistribute it and / or modify
** it under the terms of the GNU General Public License as published by
** the Free Software Foundation, either version 2 of the License, or
** (at your option) any later version.
**
** gifanim is distributed in the hope that it will be useful,
** but WITHOUT ANY WARRANTY; without even the implied warranty of
** MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.See the
** GNU General Public License for more details.
**
** You should have received a copy of the GNU General Public License
** along with gifanim. If not, see <http://www.gnu.org/licenses/>.
*/

#include <stdio.h>
#include <string.h>
#include <climits>
#include <algorithm>
#include "gifanim.h"

bool Opts::ParseClip(char *clipstr)
{
	// Split into comma-seperated values
	for (char *tok = strtok(clipstr, ","); tok != nullptr; tok = strtok(nullptr, ","))
	{
		char *brk = strpbrk(tok, ":-");
		unsigned start, end;
		if (brk == nullptr)
		{
			// Only one value, no range: Extract a single frame.
			start = end = strtoul(tok, nullptr, 10);
		}
		else
		{
			char *endptr;
			start = (unsigned)strtoul(tok, &endptr, 10);
			if (endptr > brk) start = 1u;	// check for when the initial frame is omitted
			end = (unsigned)strtoul(brk + 1, nullptr, 10);
			if (end == 0) end = UINT_MAX;
		}
		if (start == 0)
		{
			fprintf(stderr, "Frame numbers start at 1\n");
			return false;
		}
		if (end < start)
		{
			fprintf(stderr, "Start of range must come before the end\n");
			return false;
		}
		Clips.push_back(std::make_pair(start, end));
	}
	return true;
}

void Opts::SortClips()
{
	// Sort by start frame.
	std::sort(begin(Clips), end(Clips));

	// Now check for overlapping or abutting ranges and combine them.
	for (size_t i = 1; i < Clips.size(); ++i)
	{
		if (Clips[i - 1].second >= Clips[i].first - 1)
		{
			Clips[i - 1].second = std::max(Clips[i - 1].second, Clips[i].second);
			Clips.erase(begin(Clips) + i);
			// Backup since we deleted an element and need to recheck entry i.
			--i;
		}
	}
}

// framenum is 1-based. With no clips, every frame is wanted.
bool Opts::WantFrame(unsigned framenum) const
{
	if (Clips.empty())
	{
		return true;
	}
	for (const auto &clip : Clips)
	{
		if (framenum >= clip.first && framenum <= clip.second)
		{
			return true;
		}
	}
	return false;
}
