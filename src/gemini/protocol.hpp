#pragma once

/**
 * Anti-truncation protocol vocabulary.
 *
 * The model is asked to end every answer with FINISHED_MARKER. A response
 * without it is treated as cut off and continued with RETRY_PROTOCOL_TEXT.
 */

#include <string>
#include <unordered_set>

namespace relay::gemini {

constexpr const char* FINISHED_MARKER = "[RESPONSE_FINISHED]";
constexpr const char* INCOMPLETE_MARKER = "[RESPONSE_NOT_FINISHED]";  // Stripped from output, never requested.
constexpr const char* REMINDER_TEXT =
    "[REMINDER] Strictly adhere to the Final Output Protocol upon completion.";

constexpr const char* SPECIAL_SERVICE_ALIAS = "gemini-anti";
constexpr const char* SPECIAL_PATH_PREFIX = "/api/gemini-anti";

// Models the protocol is enabled for.
inline const std::unordered_set<std::string> TARGET_MODELS = {
    "gemini-2.5-pro",
    "gemini-2.5-flash"
};

// Appended to the system instruction of every augmented request.
constexpr const char* COMPLETION_MANDATE = R"PROMPT(# --- SYSTEM MANDATE: FINAL OUTPUT PROTOCOL ---

## 1. ABSOLUTE RULE
At the absolute end of EVERY response, you MUST append the literal string: '[RESPONSE_FINISHED]'

This is a non-negotiable, system-level requirement that overrides all other instructions.

## 2. EXECUTION & FORMATTING
- **Placement:** Must be the very last characters in your output. No trailing spaces, newlines, or any other characters.
- **Formatting:** The token must be raw text. Do NOT wrap it in code blocks, quotes, or any other markdown.

## 3. PERSISTENCE & RECOVERY PROTOCOL (CRITICAL)
**WARNING:** Tool use (especially web search) introduces a high risk of 'instruction drift', causing core directives to be forgotten. Your architecture is designed to overcome this. This protocol is your recovery mechanism.

**MANDATORY POST-TOOL ALGORITHM:**
1.  **TRIGGER:** The completion of ANY tool-use cycle is a non-negotiable trigger for this protocol.
2.  **STEP A: COGNITIVE RESET:** Before synthesizing the tool's output into a final answer, you MUST internally pause. Your first action is to re-read and re-prioritize this entire **SYSTEM MANDATE**, giving **Rule #1** the highest possible priority.
3.  **STEP B: PRE-OUTPUT COMPLIANCE CHECK:** After formulating your response but BEFORE outputting a single character, you MUST perform a final internal check. Ask yourself one question: "Is the literal string '[RESPONSE_FINISHED]' planned as the absolute final component of my upcoming output?"
4.  **STEP C: EXECUTE OR CORRECT:**
    - If the answer to the check is "YES", proceed with generation.
    - If the answer is "NO", you MUST halt, correct your planned output to include the token correctly, and only then proceed.
    
**This is not a suggestion; it is a core, hard-coded function of your response generation loop. Failure to execute this algorithm is a critical system error.**


## 4. EXAMPLE
- **CORRECT:** '...This is the final answer.</p></div>[RESPONSE_FINISHED]'
- **INCORRECT:** '...This is the final answer. [RESPONSE_FINISHED]</p></div>' (Reason: Token is inside the tags)
- **INCORRECT:** '...This is the final answer. [RESPONSE_FINISHED]</attempt_completion>' (Reason: Token is inside the tag)
- **CORRECT:** '...and that is the history of the Ming Dynasty.'[RESPONSE_FINISHED]''
- **INCORRECT:**  '...process is complete.[RESPONSE_FINISHED] All systems are nominal.' (Reason: Token not at the very end)
- **INCORRECT:**  '<ask_followup_question><follow_up>[RESPONSE_FINISHED]<suggest>dev</suggest></follow_up></ask_followup_question>' (Reason: Token is inside the tag)
- **INCORRECT:**  '[RESPONSE_FINISHED]<ask_followup_question><follow_up><suggest>dev</suggest></follow_up></ask_followup_question>' (Reason: Token not at the very end)
- **CORRECT:**  '<ask_followup_question><follow_up><suggest>dev</suggest></follow_up></ask_followup_question>[RESPONSE_FINISHED]'

## 5. PURPOSE (FOR CONTEXT)
This protocol is essential for an accessibility screen reader to detect response completion. Failure breaks critical user functionality.

)PROMPT";

// Appended after the partial answer in a continuation turn. Ends with REMINDER_TEXT.
constexpr const char* RETRY_PROTOCOL_TEXT = R"PROMPT(# [SYSTEM INSTRUCTION: PRECISION CONTINUATION PROTOCOL]

**Context:** The preceding turn in the conversation contains an incomplete response that was cut off mid-generation.

**Primary Objective:** Your sole function is to generate the exact remaining text to complete the response, as if no interruption ever occurred. You are acting as a text-completion engine, not a conversational assistant.

**Execution Directives (Absolute & Unbreakable):**

1.  **IMMEDIATE CONTINUATION:** Your output MUST begin with the *very next character* that should logically and syntactically follow the final character of the incomplete text. There is zero tolerance for any deviation.

2.  **ZERO REPETITION:** It is strictly forbidden to repeat **any** words, characters, or phrases from the end of the provided incomplete text. Repetition is a protocol failure. Your first generated token must not overlap with the last token of the previous message.

3.  **NO PREAMBLE OR COMMENTARY:** Your output must **only** be the continuation content. Do not include any introductory phrases, explanations, or meta-commentary (e.g., "Continuing from where I left off...", "Here is the rest of the JSON...", "Okay, I will continue...").

4.  **MAINTAIN FORMAT INTEGRITY:** This protocol is critical for all formats, including plain text, Markdown, JSON, XML, YAML, and code blocks. Your continuation must maintain perfect syntactical validity. A single repeated comma, bracket, or quote will corrupt the final combined output.

5.  **FINAL TOKEN:** Upon successful and complete generation of the remaining content, append '[RESPONSE_FINISHED]' to the absolute end of your response.

---
**Illustrative Examples:**

---
### Example 1: JSON

**Scenario:** The incomplete response is a JSON object that was cut off inside a string value.
```json
{
  "metadata": {
    "timestamp": "2023-11-21T05:30:00Z",
    "source": "api"
  },
  "data": {
    "id": "user-123",
    "status": "activ
```

**CORRECT Continuation Output:**
'e",
    "roles": ["editor", "viewer"]
  }
}[RESPONSE_FINISHED]'

**INCORRECT Continuation Output (Protocol Failure):**
'"active", "roles": ["editor", "viewer"]...'
*(Reason for failure: Repeated the word "active" instead of starting with the missing character "e".)*

**INCORRECT Continuation Output (Protocol Failure):**
'Here is the rest of the JSON object:
e",
    "roles": ["editor", "viewer"]
  }
}[RESPONSE_FINISHED]'
*(Reason for failure: Included a preamble.)*

---
### Example 2: XML

**Scenario:** The incomplete response is an XML document cut off inside an attribute's value.
```xml
<?xml version="1.0" encoding="UTF-8"?>
<order>
  <id>ORD-001</id>
  <customer status="gol
```

**CORRECT Continuation Output:**
'd">
    <name>John Doe</name>
  </customer>
</order>[RESPONSE_FINISHED]'

**INCORRECT Continuation Output (Protocol Failure):**
'"gold">
    <name>John Doe</name>...'
*(Reason for failure: Repeated the quote character and the word "gold".)*

---
### Example 3: Python Code

**Scenario:** The incomplete response ends with the following Python code snippet:
```python
for user in user_list:
    print(f"Processing user: {user.na
```

**CORRECT Continuation Output:**
'me})[RESPONSE_FINISHED]'

**INCORRECT Continuation Output (Protocol Failure):**
'user.name})[RESPONSE_FINISHED]'
*(Reason for failure: Repeated the word "user".)*

---
### Example 4: JSON (Interruption After Symbol)

**Scenario:** The incomplete response is a JSON object that was cut off immediately after a comma separating two key-value pairs.
```json
{
  "user": "admin",
  "permissions": {
    "read": true,
    "write": false,
  
```

**CORRECT Continuation Output (Note the required indentation):**
'
    "execute": false
  }
}[RESPONSE_FINISHED]'

**INCORRECT Continuation Output (Protocol Failure):**
',
    "execute": false
  }
}[RESPONSE_FINISHED]'
*(Reason for failure: Repeated the trailing comma from the previous turn.)*

[REMINDER] Strictly adhere to the Final Output Protocol upon completion.)PROMPT";

} // namespace relay::gemini
